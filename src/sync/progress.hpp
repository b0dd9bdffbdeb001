#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace kioku::sync {

/**
 * SyncProgress - thread-safe, weighted progress tree.
 *
 * A node has a total and a completed count of its own units. A child
 * created with make_child(n) stands for n of the parent's units and
 * contributes fraction() * n to the parent as it advances.
 *
 *   SyncProgress pass;
 *   pass.set_total(13);
 *   auto& assignments = pass.make_child(8);
 *   assignments.set_total(pages);
 */
class SyncProgress {
public:
    SyncProgress() = default;

    SyncProgress(const SyncProgress&) = delete;
    SyncProgress& operator=(const SyncProgress&) = delete;

    void set_total(int64_t total);
    void add_completed(int64_t units = 1);

    /**
     * Mark every unit done, including those held by children.
     */
    void complete();

    /**
     * Back to an empty, unfinished node. Children are destroyed, so
     * references returned by make_child() must no longer be in use.
     */
    void reset();

    /**
     * Child node owned by this one; the reference stays valid for the
     * lifetime of the parent.
     */
    SyncProgress& make_child(int64_t pending_units);

    [[nodiscard]] int64_t total() const;
    [[nodiscard]] int64_t completed() const;

    /**
     * Done fraction in [0, 1], children included.
     */
    [[nodiscard]] double fraction() const;

private:
    struct Child {
        std::unique_ptr<SyncProgress> node;
        int64_t units;
    };

    mutable std::mutex mutex_;
    int64_t total_ = 0;
    int64_t completed_ = 0;
    bool finished_ = false;
    std::vector<Child> children_;
};

} // namespace kioku::sync
