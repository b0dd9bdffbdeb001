#include "core/catalogue.hpp"

#include <algorithm>

namespace kioku {

InMemoryCatalogue::InMemoryCatalogue(std::vector<Subject> subjects,
                                     std::vector<SubjectId> deleted) {
    for (const auto& subject : subjects) {
        add_subject(subject);
    }
    for (SubjectId id : deleted) {
        mark_deleted(id);
    }
}

void InMemoryCatalogue::add_subject(const Subject& subject) {
    subjects_[subject.id] = subject;
    deleted_.erase(subject.id);
}

void InMemoryCatalogue::mark_deleted(SubjectId id) {
    subjects_.erase(id);
    deleted_.insert(id);
}

bool InMemoryCatalogue::is_valid_subject(SubjectId id) const {
    auto it = subjects_.find(id);
    if (it == subjects_.end()) {
        return false;
    }
    return accessible_level_ <= 0 || it->second.level <= accessible_level_;
}

LevelSubjects InMemoryCatalogue::subjects_at_level(int level) const {
    LevelSubjects result;
    for (const auto& [id, subject] : subjects_) {
        if (subject.level != level) continue;
        switch (subject.type) {
            case SubjectType::Radical:
                result.radicals.push_back(id);
                break;
            case SubjectType::Kanji:
                result.kanji.push_back(id);
                break;
            case SubjectType::Vocabulary:
                result.vocabulary.push_back(id);
                break;
            case SubjectType::Unknown:
                break;
        }
    }
    return result;
}

std::vector<SubjectId> InMemoryCatalogue::deleted_subject_ids() const {
    return std::vector<SubjectId>(deleted_.begin(), deleted_.end());
}

int InMemoryCatalogue::maximum_level() const {
    int max_level = 0;
    for (const auto& [id, subject] : subjects_) {
        max_level = std::max(max_level, subject.level);
    }
    return max_level;
}

} // namespace kioku
