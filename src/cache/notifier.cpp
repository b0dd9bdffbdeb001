#include "cache/notifier.hpp"

#include <QMetaObject>

namespace kioku::cache {

ChangeNotifier::ChangeNotifier(QObject* parent)
    : QObject(parent) {
}

ChangeNotifier::~ChangeNotifier() = default;

void ChangeNotifier::post(Notification notification) {
    QMetaObject::invokeMethod(this, [this, notification]() {
        deliver(notification);
    }, Qt::QueuedConnection);
}

void ChangeNotifier::deliver(Notification notification) {
    switch (notification) {
        case Notification::Unauthorized:
            emit unauthorized();
            break;
        case Notification::AvailableItemsChanged:
            emit availableItemsChanged();
            break;
        case Notification::PendingItemsChanged:
            emit pendingItemsChanged();
            break;
        case Notification::UserInfoChanged:
            emit userInfoChanged();
            break;
        case Notification::SrsCategoryCountsChanged:
            emit srsCategoryCountsChanged();
            break;
    }
}

} // namespace kioku::cache
