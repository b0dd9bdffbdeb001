#include "storage/record_codec.hpp"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>

namespace kioku::storage {
namespace {

Blob to_blob(const QJsonObject& obj) {
    const auto bytes = QJsonDocument(obj).toJson(QJsonDocument::Compact);
    return Blob(bytes.begin(), bytes.end());
}

Result<QJsonObject, Error> parse_blob(const Blob& blob, const char* what) {
    const QByteArray bytes(reinterpret_cast<const char*>(blob.data()),
                           static_cast<qsizetype>(blob.size()));
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(bytes, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return Result<QJsonObject, Error>::err(Error{
            std::string("invalid ") + what + " record: " + err.errorString().toStdString()});
    }
    return Result<QJsonObject, Error>::ok(doc.object());
}

void put_time(QJsonObject& obj, const char* key, const std::optional<Timestamp>& ts) {
    if (ts) {
        obj[QLatin1String(key)] = static_cast<qint64>(ts->millis());
    }
}

std::optional<Timestamp> get_time(const QJsonObject& obj, const char* key) {
    const auto value = obj.value(QLatin1String(key));
    if (value.isUndefined() || value.isNull()) {
        return std::nullopt;
    }
    return Timestamp(value.toInteger());
}

QString qstr(const std::string& s) {
    return QString::fromStdString(s);
}

QJsonObject assignment_to_json(const Assignment& a) {
    QJsonObject obj;
    obj["id"] = static_cast<qint64>(a.id);
    obj["subject_id"] = static_cast<qint64>(a.subject_id);
    obj["subject_type"] = static_cast<int>(a.subject_type);
    obj["level"] = a.level;
    obj["srs_stage"] = a.srs_stage;
    put_time(obj, "unlocked_at", a.unlocked_at);
    put_time(obj, "started_at", a.started_at);
    put_time(obj, "available_at", a.available_at);
    return obj;
}

Assignment assignment_from_json(const QJsonObject& obj) {
    Assignment a;
    a.id = obj["id"].toInteger();
    a.subject_id = obj["subject_id"].toInteger();
    a.subject_type = subject_type_from_int(obj["subject_type"].toInt());
    a.level = obj["level"].toInt();
    a.srs_stage = obj["srs_stage"].toInt();
    a.unlocked_at = get_time(obj, "unlocked_at");
    a.started_at = get_time(obj, "started_at");
    a.available_at = get_time(obj, "available_at");
    return a;
}

} // namespace

Blob encode_assignment(const Assignment& assignment) {
    return to_blob(assignment_to_json(assignment));
}

Result<Assignment, Error> decode_assignment(const Blob& blob) {
    return parse_blob(blob, "assignment").map(assignment_from_json);
}

Blob encode_progress(const Progress& progress) {
    QJsonObject obj;
    obj["assignment"] = assignment_to_json(progress.assignment);
    obj["is_lesson"] = progress.is_lesson;
    obj["meaning_wrong"] = progress.meaning_wrong;
    obj["reading_wrong"] = progress.reading_wrong;
    obj["meaning_wrong_count"] = progress.meaning_wrong_count;
    obj["reading_wrong_count"] = progress.reading_wrong_count;
    obj["created_at"] = static_cast<qint64>(progress.created_at.millis());
    return to_blob(obj);
}

Result<Progress, Error> decode_progress(const Blob& blob) {
    auto parsed = parse_blob(blob, "progress");
    if (parsed.is_err()) {
        return Result<Progress, Error>::err(parsed.unwrap_err());
    }
    const auto& obj = parsed.unwrap();
    if (!obj["assignment"].isObject()) {
        return Result<Progress, Error>::err(Error{"invalid progress record: missing assignment"});
    }

    Progress p;
    p.assignment = assignment_from_json(obj["assignment"].toObject());
    p.is_lesson = obj["is_lesson"].toBool();
    p.meaning_wrong = obj["meaning_wrong"].toBool();
    p.reading_wrong = obj["reading_wrong"].toBool();
    p.meaning_wrong_count = obj["meaning_wrong_count"].toInt();
    p.reading_wrong_count = obj["reading_wrong_count"].toInt();
    p.created_at = Timestamp(obj["created_at"].toInteger());
    return Result<Progress, Error>::ok(std::move(p));
}

Blob encode_study_materials(const StudyMaterials& materials) {
    QJsonArray synonyms;
    for (const auto& synonym : materials.meaning_synonyms) {
        synonyms.append(qstr(synonym));
    }

    QJsonObject obj;
    obj["id"] = static_cast<qint64>(materials.id);
    obj["subject_id"] = static_cast<qint64>(materials.subject_id);
    obj["meaning_note"] = qstr(materials.meaning_note);
    obj["reading_note"] = qstr(materials.reading_note);
    obj["meaning_synonyms"] = synonyms;
    return to_blob(obj);
}

Result<StudyMaterials, Error> decode_study_materials(const Blob& blob) {
    return parse_blob(blob, "study materials").map([](const QJsonObject& obj) {
        StudyMaterials m;
        m.id = obj["id"].toInteger();
        m.subject_id = obj["subject_id"].toInteger();
        m.meaning_note = obj["meaning_note"].toString().toStdString();
        m.reading_note = obj["reading_note"].toString().toStdString();
        for (const auto& synonym : obj["meaning_synonyms"].toArray()) {
            m.meaning_synonyms.push_back(synonym.toString().toStdString());
        }
        return m;
    });
}

Blob encode_user(const User& user) {
    QJsonObject obj;
    obj["username"] = qstr(user.username);
    if (user.level) {
        obj["level"] = *user.level;
    }
    obj["max_level_granted_by_subscription"] = user.max_level_granted_by_subscription;
    obj["subscribed"] = user.subscribed;
    put_time(obj, "started_at", user.started_at);
    return to_blob(obj);
}

Result<User, Error> decode_user(const Blob& blob) {
    return parse_blob(blob, "user").map([](const QJsonObject& obj) {
        User u;
        u.username = obj["username"].toString().toStdString();
        if (obj.contains("level")) {
            u.level = obj["level"].toInt();
        }
        u.max_level_granted_by_subscription = obj["max_level_granted_by_subscription"].toInt();
        u.subscribed = obj["subscribed"].toBool();
        u.started_at = get_time(obj, "started_at");
        return u;
    });
}

Blob encode_level(const Level& level) {
    QJsonObject obj;
    obj["id"] = static_cast<qint64>(level.id);
    obj["level"] = level.level;
    put_time(obj, "unlocked_at", level.unlocked_at);
    put_time(obj, "started_at", level.started_at);
    put_time(obj, "passed_at", level.passed_at);
    put_time(obj, "completed_at", level.completed_at);
    put_time(obj, "abandoned_at", level.abandoned_at);
    return to_blob(obj);
}

Result<Level, Error> decode_level(const Blob& blob) {
    return parse_blob(blob, "level").map([](const QJsonObject& obj) {
        Level l;
        l.id = obj["id"].toInteger();
        l.level = obj["level"].toInt();
        l.unlocked_at = get_time(obj, "unlocked_at");
        l.started_at = get_time(obj, "started_at");
        l.passed_at = get_time(obj, "passed_at");
        l.completed_at = get_time(obj, "completed_at");
        l.abandoned_at = get_time(obj, "abandoned_at");
        return l;
    });
}

} // namespace kioku::storage
