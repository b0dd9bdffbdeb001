#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>

#include "app/catalogue_file.hpp"
#include "app/cli/report.hpp"
#include "app/config.hpp"
#include "app/logging.hpp"
#include "cache/notifier.hpp"
#include "client/local_cache.hpp"
#include "sync/remote_gateway.hpp"

namespace {

int fail(const kioku::Error& error) {
    QTextStream(stderr) << QString::fromStdString(error.message) << QLatin1Char('\n');
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("Kioku");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Kioku");
    app.setOrganizationDomain("kioku.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Kioku local cache tool"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (sets KIOKU_DB_PATH for this run)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption catalogueOption(
        QStringList{QStringLiteral("catalogue")},
        QStringLiteral("Subject catalogue snapshot (JSON)."),
        QStringLiteral("file"));
    parser.addOption(catalogueOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (for commands that support it)."));
    parser.addOption(jsonOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync debug logging (also sets KIOKU_DEBUG_SYNC=1)."));
    parser.addOption(debugSyncOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("status | level <n> | errors | clear"));
    parser.process(app);

    if (parser.isSet(dbPathOption)) {
        qputenv("KIOKU_DB_PATH", parser.value(dbPathOption).toUtf8());
    }
    if (parser.isSet(debugSyncOption)) {
        qputenv("KIOKU_DEBUG_SYNC", "1");
    }

    const auto config = kioku::app::load_config();

    const auto log_options = kioku::app::load_log_options();
    kioku::app::install_file_logging(log_options);
    if (config.debug_sync) {
        kioku::app::enable_sync_debug_logging();
    }
    qInfo() << "Kioku: logging to" << kioku::app::log_file_path(log_options);

    kioku::InMemoryCatalogue catalogue;
    if (parser.isSet(catalogueOption)) {
        auto loaded = kioku::app::load_catalogue(parser.value(catalogueOption));
        if (loaded.is_err()) {
            return fail(loaded.unwrap_err());
        }
        catalogue = std::move(loaded).unwrap();
    }

    kioku::sync::OfflineGateway gateway;
    kioku::cache::ChangeNotifier notifier;
    auto opened = kioku::client::LocalCache::open(config, gateway, catalogue, &notifier);
    if (opened.is_err()) {
        return fail(opened.unwrap_err());
    }
    auto cache = std::move(opened).unwrap();

    const auto positional = parser.positionalArguments();
    const auto command = positional.isEmpty() ? QStringLiteral("status") : positional.first();
    const bool json = parser.isSet(jsonOption);
    QTextStream out(stdout);

    if (command == QStringLiteral("status")) {
        auto status = kioku::app::collect_status(*cache);
        if (status.is_err()) {
            return fail(status.unwrap_err());
        }
        out << (json ? kioku::app::format_status_json(status.unwrap())
                     : kioku::app::format_status(status.unwrap()));
        return 0;
    }

    if (command == QStringLiteral("level")) {
        auto level = kioku::app::parse_level(positional.value(1), catalogue);
        if (level.is_err()) {
            return fail(level.unwrap_err());
        }
        auto assignments = cache->assignments_at_level(level.unwrap());
        if (assignments.is_err()) {
            return fail(assignments.unwrap_err());
        }
        out << (json ? kioku::app::format_level_json(assignments.unwrap())
                     : kioku::app::format_level(assignments.unwrap()));
        return 0;
    }

    if (command == QStringLiteral("errors")) {
        auto entries = cache->error_log();
        if (entries.is_err()) {
            return fail(entries.unwrap_err());
        }
        out << kioku::app::format_error_log_json(entries.unwrap());
        return 0;
    }

    if (command == QStringLiteral("clear")) {
        auto cleared = cache->clear_all_data();
        if (cleared.is_err()) {
            return fail(cleared.unwrap_err());
        }
        out << "Local cache cleared\n";
        return 0;
    }

    return fail(kioku::Error{"unknown command: " + command.toStdString()});
}
