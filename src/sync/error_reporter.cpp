#include "sync/error_reporter.hpp"
#include "core/log.hpp"

namespace kioku::sync {

namespace {

std::string format_headers(const std::map<std::string, std::string>& headers) {
    std::string out;
    for (const auto& [name, value] : headers) {
        out += name;
        out += ": ";
        out += value;
        out += '\n';
    }
    return out;
}

} // namespace

storage::ErrorLogEntry ErrorReporter::to_log_entry(const SyncError& error) {
    storage::ErrorLogEntry entry;
    entry.description = error.description;
    if (error.kind == SyncErrorKind::Other) {
        return entry;
    }

    entry.code = error.status;
    if (error.request) {
        entry.request_url = error.request->url;
        entry.request_headers = format_headers(error.request->headers);
        entry.request_data = error.request->body;
    }
    if (error.response) {
        entry.response_url = error.response->url;
        entry.response_headers = format_headers(error.response->headers);
        entry.response_data = error.response->body;
    }
    return entry;
}

ReportDisposition ErrorReporter::report(const SyncError& error) {
    switch (error.kind) {
        case SyncErrorKind::Unauthorized:
            qCInfo(kiokuSyncLog) << "Remote service rejected credentials";
            if (notifier_) {
                notifier_->post(cache::Notification::Unauthorized);
            }
            return ReportDisposition::Unauthorized;

        case SyncErrorKind::Connectivity:
        case SyncErrorKind::Unprocessable:
            qCDebug(kiokuSyncLog) << "Ignoring" << sync_error_kind_name(error.kind)
                                  << "failure:" << error.description.c_str();
            return ReportDisposition::Ignored;

        case SyncErrorKind::Decode:
        case SyncErrorKind::HttpStatus:
        case SyncErrorKind::Storage:
        case SyncErrorKind::Other:
            log(error);
            return ReportDisposition::Logged;
    }
    log(error);
    return ReportDisposition::Logged;
}

void ErrorReporter::log(const SyncError& error) {
    qCWarning(kiokuSyncLog) << "Logging error:" << error.status.value_or(0)
                            << error.description.c_str();
    if (error.kind != SyncErrorKind::Other) {
        if (error.request) {
            qCWarning(kiokuSyncLog) << "Failed request URL:" << error.request->url.c_str();
            if (!error.request->body.empty()) {
                qCWarning(kiokuSyncLog) << "Failed request body:" << error.request->body.c_str();
            }
        }
        if (error.response) {
            qCWarning(kiokuSyncLog) << "Failed response:" << error.response->url.c_str();
            if (!error.response->body.empty()) {
                qCWarning(kiokuSyncLog) << "Failed response body:" << error.response->body.c_str();
            }
        }
    }

    auto entry = to_log_entry(error);
    auto written = store_.write([&](storage::Database& db) {
        return storage::ErrorLogRepository(db).append(entry, log_capacity_);
    });
    if (written.is_err()) {
        qCWarning(kiokuSyncLog) << "Failed to write error log:"
                                << written.unwrap_err().message.c_str();
    }
}

} // namespace kioku::sync
