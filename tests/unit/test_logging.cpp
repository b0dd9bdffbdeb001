#include <catch2/catch_test_macros.hpp>
#include "app/logging.hpp"
#include "core/log.hpp"

#include <QFile>
#include <QTemporaryDir>
#include <QTimeZone>

using namespace kioku::app;

namespace {

QString read_all(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return QString{};
    }
    return QString::fromUtf8(file.readAll());
}

} // namespace

TEST_CASE("Log lines carry time, severity and category", "[app][logging]") {
    const auto at = QDateTime::fromMSecsSinceEpoch(1790000000123, QTimeZone::utc());

    REQUIRE(format_log_line(QtWarningMsg, "kioku.sync", QStringLiteral("fetch failed"), at) ==
            QStringLiteral("2026-09-21T14:13:20.123Z W kioku.sync fetch failed\n"));
    REQUIRE(format_log_line(QtInfoMsg, nullptr, QStringLiteral("hello"), at)
                .endsWith(QStringLiteral(" I default hello\n")));
}

TEST_CASE("File logging writes to the configured file", "[app][logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("logs/kioku.log"));

    SECTION("Messages are appended") {
        LogOptions options{.file_path = path, .echo_warnings = false};
        REQUIRE(log_file_path(options) == path);

        install_file_logging(options);
        qCInfo(kiokuSyncLog, "updated %d assignments", 3);
        qInstallMessageHandler(nullptr);

        const auto text = read_all(path);
        REQUIRE(text.contains(QStringLiteral(" I kioku.sync updated 3 assignments\n")));
    }

    SECTION("A full file is rotated") {
        install_file_logging({.file_path = path, .max_file_bytes = 16, .echo_warnings = false});
        qCInfo(kiokuSyncLog, "first message");
        qCInfo(kiokuSyncLog, "second message");
        qInstallMessageHandler(nullptr);

        REQUIRE(read_all(path + QStringLiteral(".1")).contains(QStringLiteral("second message")));
        REQUIRE_FALSE(read_all(path).contains(QStringLiteral("first message")));
    }
}
