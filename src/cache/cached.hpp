#pragma once

#include "cache/notifier.hpp"
#include "core/result.hpp"
#include <functional>
#include <mutex>
#include <optional>

namespace kioku::cache {

/**
 * Cached<T> - a memoized value computed from the store.
 *
 * Starts stale. get() recomputes on the calling thread when stale;
 * invalidate() only marks it stale and posts the associated notification.
 * A failed computation leaves the value stale so the next get() retries.
 */
template<typename T>
class Cached {
public:
    using Producer = std::function<Result<T, Error>()>;

    explicit Cached(Producer producer,
                    ChangeNotifier* notifier = nullptr,
                    std::optional<Notification> notification = std::nullopt)
        : producer_(std::move(producer))
        , notifier_(notifier)
        , notification_(notification) {}

    Cached(const Cached&) = delete;
    Cached& operator=(const Cached&) = delete;

    [[nodiscard]] Result<T, Error> get() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stale_ && value_) {
            return Result<T, Error>::ok(*value_);
        }

        auto produced = producer_();
        if (produced.is_err()) {
            return produced;
        }
        value_ = produced.unwrap();
        stale_ = false;
        return produced;
    }

    void invalidate() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stale_ = true;
        }
        if (notifier_ && notification_) {
            notifier_->post(*notification_);
        }
    }

    [[nodiscard]] bool is_stale() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stale_;
    }

private:
    Producer producer_;
    ChangeNotifier* notifier_;
    std::optional<Notification> notification_;

    mutable std::mutex mutex_;
    std::optional<T> value_;
    bool stale_ = true;
};

} // namespace kioku::cache
