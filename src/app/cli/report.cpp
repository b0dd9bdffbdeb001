#include "app/cli/report.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

#include <string>

namespace kioku::app {

namespace {

[[nodiscard]] const char* category_name(size_t index) {
    switch (static_cast<SrsCategory>(index)) {
        case SrsCategory::Lesson: return "lesson";
        case SrsCategory::Apprentice: return "apprentice";
        case SrsCategory::Guru: return "guru";
        case SrsCategory::Master: return "master";
        case SrsCategory::Enlightened: return "enlightened";
        case SrsCategory::Burned: return "burned";
    }
    return "unknown";
}

[[nodiscard]] QString type_name(SubjectType type) {
    const auto name = subject_type_name(type);
    return QString::fromLatin1(name.data(), static_cast<qsizetype>(name.size()));
}

[[nodiscard]] QJsonValue optional_text(const std::string& value) {
    if (value.empty()) {
        return QJsonValue(QJsonValue::Null);
    }
    return QJsonValue(QString::fromStdString(value));
}

} // namespace

Result<CacheStatus, Error> collect_status(client::LocalCache& cache) {
    CacheStatus status;

    auto pending = cache.pending_progress_count();
    if (pending.is_err()) return Result<CacheStatus, Error>::err(pending.unwrap_err());
    status.pending_progress = pending.unwrap();

    auto materials = cache.pending_study_materials_count();
    if (materials.is_err()) return Result<CacheStatus, Error>::err(materials.unwrap_err());
    status.pending_study_materials = materials.unwrap();

    auto available = cache.available_subjects();
    if (available.is_err()) return Result<CacheStatus, Error>::err(available.unwrap_err());
    status.lessons = available.unwrap().lesson_count;
    status.reviews = available.unwrap().review_count;

    auto guru = cache.guru_kanji_count();
    if (guru.is_err()) return Result<CacheStatus, Error>::err(guru.unwrap_err());
    status.guru_kanji = guru.unwrap();

    auto categories = cache.srs_category_counts();
    if (categories.is_err()) return Result<CacheStatus, Error>::err(categories.unwrap_err());
    status.srs_counts = categories.unwrap();

    return Result<CacheStatus, Error>::ok(status);
}

QString format_status(const CacheStatus& status) {
    QStringList srs;
    for (size_t i = 1; i < status.srs_counts.size(); ++i) {
        srs.append(QStringLiteral("%1 %2")
                       .arg(QString::fromLatin1(category_name(i)))
                       .arg(status.srs_counts[i]));
    }

    QString out;
    out += QStringLiteral("Pending progress: %1\n").arg(status.pending_progress);
    out += QStringLiteral("Pending study materials: %1\n").arg(status.pending_study_materials);
    out += QStringLiteral("Lessons: %1\n").arg(status.lessons);
    out += QStringLiteral("Reviews: %1\n").arg(status.reviews);
    out += QStringLiteral("Guru kanji: %1\n").arg(status.guru_kanji);
    out += QStringLiteral("SRS: ") + srs.join(QStringLiteral(", ")) + QLatin1Char('\n');
    return out;
}

QString format_status_json(const CacheStatus& status) {
    QJsonObject srs;
    for (size_t i = 1; i < status.srs_counts.size(); ++i) {
        srs.insert(QString::fromLatin1(category_name(i)), status.srs_counts[i]);
    }

    QJsonObject root;
    root.insert(QStringLiteral("pendingProgress"), static_cast<qint64>(status.pending_progress));
    root.insert(QStringLiteral("pendingStudyMaterials"),
                static_cast<qint64>(status.pending_study_materials));
    root.insert(QStringLiteral("lessons"), status.lessons);
    root.insert(QStringLiteral("reviews"), status.reviews);
    root.insert(QStringLiteral("guruKanji"), static_cast<qint64>(status.guru_kanji));
    root.insert(QStringLiteral("srs"), srs);
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

Result<int, Error> parse_level(const QString& text, const SubjectCatalogue& catalogue) {
    bool ok = false;
    const int level = text.toInt(&ok);
    if (!ok || level < 1) {
        return Result<int, Error>::err(Error{"usage: kioku level <n>"});
    }
    const int maximum = catalogue.maximum_level();
    if (maximum > 0 && level > maximum) {
        return Result<int, Error>::err(
            Error{"level " + std::to_string(level) + " is beyond the catalogue (1-" +
                  std::to_string(maximum) + ")"});
    }
    return Result<int, Error>::ok(level);
}

QString format_level(const std::vector<Assignment>& assignments) {
    QString out;
    for (const auto& a : assignments) {
        out += QStringLiteral("%1 %2 stage %3\n")
                   .arg(a.subject_id)
                   .arg(type_name(a.subject_type))
                   .arg(a.srs_stage);
    }
    return out;
}

QString format_level_json(const std::vector<Assignment>& assignments) {
    QJsonArray items;
    for (const auto& a : assignments) {
        QJsonObject item;
        item.insert(QStringLiteral("subjectId"), static_cast<qint64>(a.subject_id));
        item.insert(QStringLiteral("type"), type_name(a.subject_type));
        item.insert(QStringLiteral("level"), a.level);
        item.insert(QStringLiteral("srsStage"), a.srs_stage);
        item.insert(QStringLiteral("locked"), !a.unlocked_at.has_value());
        items.append(item);
    }
    return QString::fromUtf8(QJsonDocument(items).toJson(QJsonDocument::Indented));
}

QString format_error_log_json(const std::vector<storage::ErrorLogEntry>& entries) {
    QJsonArray items;
    for (const auto& e : entries) {
        QJsonObject item;
        item.insert(QStringLiteral("date"), QString::fromStdString(e.date));
        item.insert(QStringLiteral("code"), e.code ? QJsonValue(*e.code) : QJsonValue(QJsonValue::Null));
        item.insert(QStringLiteral("description"), optional_text(e.description));
        item.insert(QStringLiteral("requestUrl"), optional_text(e.request_url));
        item.insert(QStringLiteral("responseUrl"), optional_text(e.response_url));
        item.insert(QStringLiteral("requestData"), optional_text(e.request_data));
        item.insert(QStringLiteral("requestHeaders"), optional_text(e.request_headers));
        item.insert(QStringLiteral("responseHeaders"), optional_text(e.response_headers));
        item.insert(QStringLiteral("responseData"), optional_text(e.response_data));
        items.append(item);
    }
    return QString::fromUtf8(QJsonDocument(items).toJson(QJsonDocument::Indented));
}

} // namespace kioku::app
