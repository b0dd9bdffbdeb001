#pragma once

#include "core/result.hpp"
#include <map>
#include <optional>
#include <string>

namespace kioku::sync {

/**
 * Failure classes the orchestrator distinguishes.
 */
enum class SyncErrorKind {
    Unauthorized,   // credentials rejected
    Unprocessable,  // remote refused one pending item as invalid
    Connectivity,   // offline, aborted or timed out
    Decode,         // malformed response
    HttpStatus,     // any other status reported by the remote service
    Storage,        // local store failure met during a sync
    Other
};

[[nodiscard]] inline const char* sync_error_kind_name(SyncErrorKind kind) {
    switch (kind) {
        case SyncErrorKind::Unauthorized: return "unauthorized";
        case SyncErrorKind::Unprocessable: return "unprocessable";
        case SyncErrorKind::Connectivity: return "connectivity";
        case SyncErrorKind::Decode: return "decode";
        case SyncErrorKind::HttpStatus: return "http-status";
        case SyncErrorKind::Storage: return "storage";
        case SyncErrorKind::Other: return "other";
    }
    return "other";
}

/**
 * Request or response context attached to remote failures.
 */
struct HttpExchange {
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
};

struct SyncError {
    SyncErrorKind kind = SyncErrorKind::Other;
    std::optional<int> status;
    std::string description;
    std::optional<HttpExchange> request;
    std::optional<HttpExchange> response;

    [[nodiscard]] static SyncError of(SyncErrorKind kind, std::string description) {
        SyncError error;
        error.kind = kind;
        error.description = std::move(description);
        return error;
    }

    [[nodiscard]] static SyncError from_storage(const Error& error) {
        SyncError result = of(SyncErrorKind::Storage, error.message);
        if (error.code != 0) {
            result.status = error.code;
        }
        return result;
    }
};

template<typename T>
using SyncResult = Result<T, SyncError>;

} // namespace kioku::sync
