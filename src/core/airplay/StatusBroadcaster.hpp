#pragma once

#include "core/airplay/StatusSnapshot.hpp"
#include <QHash>
#include <QList>
#include <QMutex>
#include <QObject>
#include <QPointer>
#include <functional>

namespace adk {
namespace airplay {

class StreamingSessionManager;

/// Fans session transitions out to subscribers. Each subscriber gets its own
/// bounded queue drained on its context's event loop; when the queue is full
/// the oldest undelivered snapshot is dropped.
class StatusBroadcaster : public QObject {
    Q_OBJECT
public:
    using Callback = std::function<void(const StatusSnapshot&)>;

    StatusBroadcaster(StreamingSessionManager* manager, int queueDepth = 4,
                      QObject* parent = nullptr);

    StatusSnapshot snapshot() const;

    /// Deliveries run on context's thread (this object's when null). A
    /// subscription whose context is destroyed is dropped.
    int subscribe(Callback callback, QObject* context = nullptr);
    void unsubscribe(int subscriptionId);

    int subscriberCount() const;
    /// Snapshots discarded for this subscriber because its queue was full.
    int droppedCount(int subscriptionId) const;

public slots:
    void publish(const adk::airplay::StatusSnapshot& snapshot);

private:
    struct Subscription {
        Callback callback;
        QPointer<QObject> context;
        QList<StatusSnapshot> queue;
        bool drainScheduled = false;
        int dropped = 0;
    };

    void drain(int subscriptionId);

    StreamingSessionManager* manager_;
    int queueDepth_;

    mutable QMutex mutex_;
    int nextId_ = 1;
    QHash<int, Subscription> subscriptions_;
};

} // namespace airplay
} // namespace adk
