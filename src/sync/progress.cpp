#include "sync/progress.hpp"

#include <algorithm>

namespace kioku::sync {

void SyncProgress::set_total(int64_t total) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_ = std::max<int64_t>(total, 0);
}

void SyncProgress::add_completed(int64_t units) {
    std::lock_guard<std::mutex> lock(mutex_);
    completed_ += units;
}

void SyncProgress::complete() {
    std::vector<SyncProgress*> children;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
        completed_ = std::max(completed_, total_);
        for (auto& child : children_) {
            children.push_back(child.node.get());
        }
    }
    for (auto* child : children) {
        child->complete();
    }
}

void SyncProgress::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    total_ = 0;
    completed_ = 0;
    finished_ = false;
    children_.clear();
}

SyncProgress& SyncProgress::make_child(int64_t pending_units) {
    std::lock_guard<std::mutex> lock(mutex_);
    children_.push_back(Child{std::make_unique<SyncProgress>(), pending_units});
    return *children_.back().node;
}

int64_t SyncProgress::total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

int64_t SyncProgress::completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

double SyncProgress::fraction() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_) {
        return 1.0;
    }
    if (total_ <= 0) {
        return 0.0;
    }

    double done = static_cast<double>(std::min(completed_, total_));
    for (const auto& child : children_) {
        done += child.node->fraction() * static_cast<double>(child.units);
    }
    return std::clamp(done / static_cast<double>(total_), 0.0, 1.0);
}

} // namespace kioku::sync
