#pragma once

#include "core/srs.hpp"
#include "core/types.hpp"
#include <map>
#include <set>
#include <vector>

namespace kioku {

/**
 * Subject ids at one level, split by kind.
 */
struct LevelSubjects {
    std::vector<SubjectId> radicals;
    std::vector<SubjectId> kanji;
    std::vector<SubjectId> vocabulary;
};

/**
 * SubjectCatalogue - read-only view of the immutable curriculum.
 *
 * Implementations must be safe to call from several threads at once.
 */
class SubjectCatalogue {
public:
    virtual ~SubjectCatalogue() = default;

    /**
     * Whether the subject exists and is accessible to the user right now.
     */
    [[nodiscard]] virtual bool is_valid_subject(SubjectId id) const = 0;

    [[nodiscard]] virtual LevelSubjects subjects_at_level(int level) const = 0;

    /**
     * Subjects removed from the curriculum; local rows for them are purged.
     */
    [[nodiscard]] virtual std::vector<SubjectId> deleted_subject_ids() const = 0;

    [[nodiscard]] virtual int maximum_level() const = 0;
};

/**
 * InMemoryCatalogue - catalogue built from explicit subject lists.
 */
class InMemoryCatalogue : public SubjectCatalogue {
public:
    struct Subject {
        SubjectId id = 0;
        SubjectType type = SubjectType::Unknown;
        int level = 0;
    };

    InMemoryCatalogue() = default;
    InMemoryCatalogue(std::vector<Subject> subjects, std::vector<SubjectId> deleted = {});

    void add_subject(const Subject& subject);
    void mark_deleted(SubjectId id);

    /**
     * Subjects above this level are reported invalid, as for a user whose
     * subscription stops there. 0 means no limit.
     */
    void set_accessible_level(int level) { accessible_level_ = level; }

    [[nodiscard]] bool is_valid_subject(SubjectId id) const override;
    [[nodiscard]] LevelSubjects subjects_at_level(int level) const override;
    [[nodiscard]] std::vector<SubjectId> deleted_subject_ids() const override;
    [[nodiscard]] int maximum_level() const override;

private:
    std::map<SubjectId, Subject> subjects_;
    std::set<SubjectId> deleted_;
    int accessible_level_ = 0;
};

} // namespace kioku
