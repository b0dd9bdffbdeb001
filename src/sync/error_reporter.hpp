#pragma once

#include "sync/sync_error.hpp"
#include "storage/error_log_repository.hpp"
#include "storage/store.hpp"
#include "cache/notifier.hpp"

namespace kioku::sync {

/**
 * What report() did with an error.
 */
enum class ReportDisposition {
    Ignored,       // expected, resolves on a later sync
    Unauthorized,  // unauthorized notification posted
    Logged         // written to the error log
};

/**
 * ErrorReporter - the single place that classifies sync failures.
 *
 * Connectivity failures and unprocessable items are dropped. Unauthorized
 * raises a notification so the application can ask for new credentials.
 * Everything else is appended to the capped error log; decode, status and
 * storage failures keep their request/response context, uncategorized ones
 * keep only the description.
 */
class ErrorReporter {
public:
    ErrorReporter(storage::Store& store,
                  cache::ChangeNotifier* notifier,
                  int log_capacity = storage::kDefaultErrorLogCapacity)
        : store_(store), notifier_(notifier), log_capacity_(log_capacity) {}

    ReportDisposition report(const SyncError& error);

    [[nodiscard]] static storage::ErrorLogEntry to_log_entry(const SyncError& error);

private:
    void log(const SyncError& error);

    storage::Store& store_;
    cache::ChangeNotifier* notifier_;
    int log_capacity_;
};

} // namespace kioku::sync
