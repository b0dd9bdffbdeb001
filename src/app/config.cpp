#include "app/config.hpp"

#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QtGlobal>

namespace kioku::app {

QString resolve_database_path() {
    const auto overridePath = qEnvironmentVariable("KIOKU_DB_PATH");
    if (overridePath == QStringLiteral(":memory:")) {
        return overridePath;
    }
    if (!overridePath.isEmpty()) {
        QFileInfo info(overridePath);
        QDir dir(info.absolutePath());
        if (!dir.exists()) {
            dir.mkpath(".");
        }
        return info.absoluteFilePath();
    }

    QString dataPath = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir dir(dataPath);
    if (!dir.exists()) {
        dir.mkpath(".");
    }
    return dataPath + "/local-cache.db";
}

client::CacheConfig load_config() {
    client::CacheConfig config;
    config.database_path = resolve_database_path().toStdString();

    bool ok = false;
    const int capacity = qEnvironmentVariableIntValue("KIOKU_ERROR_LOG_CAPACITY", &ok);
    if (ok && capacity > 0) {
        config.error_log_capacity = capacity;
    }

    config.debug_sync = qEnvironmentVariableIsSet("KIOKU_DEBUG_SYNC");
    return config;
}

LogOptions load_log_options() {
    LogOptions options;
    options.file_path = qEnvironmentVariable("KIOKU_LOG_FILE");
    options.echo_warnings = !qEnvironmentVariableIsSet("KIOKU_LOG_QUIET");
    return options;
}

} // namespace kioku::app
