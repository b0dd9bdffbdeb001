#include "app/catalogue_file.hpp"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace kioku::app {

namespace {

SubjectType parse_type(const QString& name) {
    if (name == QStringLiteral("radical")) return SubjectType::Radical;
    if (name == QStringLiteral("kanji")) return SubjectType::Kanji;
    if (name == QStringLiteral("vocabulary")) return SubjectType::Vocabulary;
    return SubjectType::Unknown;
}

} // namespace

Result<InMemoryCatalogue, Error> parse_catalogue(const QByteArray& json) {
    QJsonParseError parse_error;
    const auto doc = QJsonDocument::fromJson(json, &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        return Result<InMemoryCatalogue, Error>::err(
            Error{"invalid catalogue: " + parse_error.errorString().toStdString()});
    }

    const auto root = doc.object();
    InMemoryCatalogue catalogue;

    for (const auto& value : root.value(QStringLiteral("subjects")).toArray()) {
        const auto obj = value.toObject();
        const auto id = obj.value(QStringLiteral("id")).toInteger(-1);
        const auto type = parse_type(obj.value(QStringLiteral("type")).toString());
        if (id < 0 || type == SubjectType::Unknown) {
            return Result<InMemoryCatalogue, Error>::err(
                Error{"invalid catalogue subject at id " + std::to_string(id)});
        }
        catalogue.add_subject(InMemoryCatalogue::Subject{
            .id = id,
            .type = type,
            .level = obj.value(QStringLiteral("level")).toInt()
        });
    }

    for (const auto& value : root.value(QStringLiteral("deleted")).toArray()) {
        catalogue.mark_deleted(value.toInteger());
    }

    catalogue.set_accessible_level(root.value(QStringLiteral("accessibleLevel")).toInt(0));
    return Result<InMemoryCatalogue, Error>::ok(std::move(catalogue));
}

Result<InMemoryCatalogue, Error> load_catalogue(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<InMemoryCatalogue, Error>::err(
            Error{"cannot open catalogue " + path.toStdString() + ": " +
                  file.errorString().toStdString()});
    }
    return parse_catalogue(file.readAll());
}

} // namespace kioku::app
