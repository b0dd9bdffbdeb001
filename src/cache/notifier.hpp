#pragma once

#include <QObject>

namespace kioku::cache {

/**
 * Notifications the cache publishes after a committed change.
 */
enum class Notification {
    Unauthorized,
    AvailableItemsChanged,
    PendingItemsChanged,
    UserInfoChanged,
    SrsCategoryCountsChanged
};

/**
 * ChangeNotifier - fan-out of cache change notifications.
 *
 * post() may be called from any thread. Signals are always emitted on the
 * thread that owns the notifier, after the caller has returned, so a
 * listener never runs inside the transaction that caused the change.
 */
class ChangeNotifier : public QObject {
    Q_OBJECT

public:
    explicit ChangeNotifier(QObject* parent = nullptr);
    ~ChangeNotifier() override;

    void post(Notification notification);

signals:
    void unauthorized();
    void availableItemsChanged();
    void pendingItemsChanged();
    void userInfoChanged();
    void srsCategoryCountsChanged();

private:
    void deliver(Notification notification);
};

} // namespace kioku::cache
