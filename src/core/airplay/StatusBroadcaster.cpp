#include "core/airplay/StatusBroadcaster.hpp"
#include "core/airplay/StreamingSessionManager.hpp"
#include <QDebug>
#include <QMetaObject>
#include <QMutexLocker>

namespace adk {
namespace airplay {

StatusBroadcaster::StatusBroadcaster(StreamingSessionManager* manager, int queueDepth, QObject* parent)
    : QObject(parent)
    , manager_(manager)
    , queueDepth_(qMax(1, queueDepth))
{
    connect(manager_, &StreamingSessionManager::stateChanged, this, &StatusBroadcaster::publish);
}

StatusSnapshot StatusBroadcaster::snapshot() const
{
    return manager_->current();
}

int StatusBroadcaster::subscribe(Callback callback, QObject* context)
{
    QMutexLocker lock(&mutex_);
    int id = nextId_++;
    Subscription sub;
    sub.callback = std::move(callback);
    sub.context = context ? context : this;
    subscriptions_.insert(id, sub);
    return id;
}

void StatusBroadcaster::unsubscribe(int subscriptionId)
{
    QMutexLocker lock(&mutex_);
    subscriptions_.remove(subscriptionId);
}

int StatusBroadcaster::subscriberCount() const
{
    QMutexLocker lock(&mutex_);
    return subscriptions_.size();
}

int StatusBroadcaster::droppedCount(int subscriptionId) const
{
    QMutexLocker lock(&mutex_);
    auto it = subscriptions_.constFind(subscriptionId);
    return it == subscriptions_.constEnd() ? 0 : it->dropped;
}

void StatusBroadcaster::publish(const StatusSnapshot& snapshot)
{
    QMutexLocker lock(&mutex_);
    for (auto it = subscriptions_.begin(); it != subscriptions_.end();) {
        Subscription& sub = it.value();
        if (!sub.context) {
            it = subscriptions_.erase(it);
            continue;
        }

        if (sub.queue.size() >= queueDepth_) {
            sub.queue.removeFirst();
            ++sub.dropped;
            qDebug() << "[Broadcaster] Subscriber" << it.key() << "lagging, dropped oldest snapshot";
        }
        sub.queue.append(snapshot);

        if (!sub.drainScheduled) {
            sub.drainScheduled = true;
            const int id = it.key();
            QPointer<StatusBroadcaster> self(this);
            // Deliver on the subscriber's thread via QueuedConnection
            QMetaObject::invokeMethod(sub.context.data(), [self, id]() {
                if (self) self->drain(id);
            }, Qt::QueuedConnection);
        }
        ++it;
    }
}

void StatusBroadcaster::drain(int subscriptionId)
{
    Callback cb;
    QList<StatusSnapshot> pending;
    {
        QMutexLocker lock(&mutex_);
        auto it = subscriptions_.find(subscriptionId);
        if (it == subscriptions_.end()) return;
        it->drainScheduled = false;
        pending.swap(it->queue);
        cb = it->callback;  // copy callback while holding lock
    }

    for (const StatusSnapshot& snap : pending)
        cb(snap);
}

} // namespace airplay
} // namespace adk
