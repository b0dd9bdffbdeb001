#pragma once

#include <QDateTime>
#include <QString>
#include <QtGlobal>

namespace kioku::app {

struct LogOptions {
    // Empty means <AppLocalDataLocation>/logs/kioku.log.
    QString file_path;
    // The file is moved to <file>.1 once it grows past this many bytes.
    qint64 max_file_bytes = 1024 * 1024;
    // Warnings and worse are also written to stderr.
    bool echo_warnings = true;
};

/**
 * Route every Qt log message to the kioku log file so failed syncs on a
 * user's machine can be inspected later. Safe to call more than once; the
 * latest options win.
 */
void install_file_logging(const LogOptions& options = {});

// Path the file handler writes to (may be empty if unavailable).
QString log_file_path(const LogOptions& options = {});

// Turns on the kioku.sync debug category.
void enable_sync_debug_logging();

// "<iso-time> <level> <category> <message>\n"
[[nodiscard]] QString format_log_line(QtMsgType type,
                                      const char* category,
                                      const QString& message,
                                      const QDateTime& at);

} // namespace kioku::app
