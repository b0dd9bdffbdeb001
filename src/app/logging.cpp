#include "app/logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMutex>
#include <QStandardPaths>

#include <cstdio>

namespace kioku::app {
namespace {

char severity(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return 'D';
        case QtInfoMsg: return 'I';
        case QtWarningMsg: return 'W';
        case QtCriticalMsg: return 'C';
        case QtFatalMsg: return 'F';
    }
    return '?';
}

class FileSink {
public:
    void configure(const LogOptions& options) {
        QMutexLocker lock(&mutex_);
        options_ = options;
        if (file_.isOpen()) {
            file_.close();
        }
        opened_ = false;
    }

    void write(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
        const auto line = format_log_line(type, ctx.category, msg,
                                          QDateTime::currentDateTimeUtc());

        QMutexLocker lock(&mutex_);
        const bool severe = type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg;
        if (options_.echo_warnings && severe) {
            std::fputs(qPrintable(line), stderr);
        }
        if (!open_if_needed()) {
            return;
        }
        file_.write(line.toUtf8());
        file_.flush();
        if (options_.max_file_bytes > 0 && file_.size() > options_.max_file_bytes) {
            rotate();
        }
    }

private:
    bool open_if_needed() {
        if (opened_) {
            return file_.isOpen();
        }
        opened_ = true;

        const auto path = log_file_path(options_);
        if (path.isEmpty()) {
            return false;
        }
        QDir().mkpath(QFileInfo(path).absolutePath());

        file_.setFileName(path);
        if (!file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            std::fprintf(stderr, "kioku: cannot open log file %s\n", qPrintable(path));
            return false;
        }
        return true;
    }

    // Keeps one previous generation next to the live file.
    void rotate() {
        const auto path = file_.fileName();
        const auto previous = path + QStringLiteral(".1");
        file_.close();
        QFile::remove(previous);
        if (!QFile::rename(path, previous)) {
            std::fprintf(stderr, "kioku: cannot rotate log file %s\n", qPrintable(path));
        }
        opened_ = false;
    }

    QMutex mutex_;
    LogOptions options_;
    QFile file_;
    bool opened_ = false;
};

FileSink& sink() {
    static FileSink instance;
    return instance;
}

void message_handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    sink().write(type, ctx, msg);
}

} // namespace

QString format_log_line(QtMsgType type,
                        const char* category,
                        const QString& message,
                        const QDateTime& at) {
    return QStringLiteral("%1 %2 %3 %4\n")
        .arg(at.toUTC().toString(Qt::ISODateWithMs),
             QString(QLatin1Char(severity(type))),
             category ? QString::fromLatin1(category) : QStringLiteral("default"),
             message);
}

QString log_file_path(const LogOptions& options) {
    if (!options.file_path.isEmpty()) {
        return QFileInfo(options.file_path).absoluteFilePath();
    }
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/kioku.log"));
}

void install_file_logging(const LogOptions& options) {
    sink().configure(options);
    qInstallMessageHandler(message_handler);
}

void enable_sync_debug_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("kioku.sync.debug=true\n"));
}

} // namespace kioku::app
