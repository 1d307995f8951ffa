#pragma once

#include "core/airplay/IServiceBrowser.hpp"
#include <QDBusConnection>
#include <QDBusMessage>
#include <QList>
#include <QTimer>

namespace adk {
namespace airplay {

/// IServiceBrowser backed by the Avahi daemon over the system D-Bus
/// (org.freedesktop.Avahi.Server / ServiceBrowser).
///
/// Avahi may emit ItemNew on the new browser object before the
/// ServiceBrowserNew reply tells us its path, so signals that arrive while
/// the path is unknown are buffered and replayed once the reply lands.
class AvahiServiceBrowser : public IServiceBrowser {
    Q_OBJECT
public:
    explicit AvahiServiceBrowser(QObject* parent = nullptr);
    AvahiServiceBrowser(const QDBusConnection& bus, QObject* parent = nullptr);
    ~AvahiServiceBrowser() override;

    void browse(const QString& serviceType, int windowMs) override;
    void cancel() override;
    bool isBrowsing() const override { return browsing_; }

private slots:
    void onItemNew(const QDBusMessage& msg);
    void onBrowserFailure(const QDBusMessage& msg);
    void onAllForNow(const QDBusMessage& msg);

private:
    void subscribeSignals();
    void onBrowserCreated(const QString& path);
    void handleItemNew(const QDBusMessage& msg);
    void resolve(int interface, int protocol, const QString& name,
                 const QString& type, const QString& domain);
    void finishIfDrained();
    void finish();
    void fail(Failure reason, const QString& message);
    void teardown();

    QDBusConnection bus_;
    bool signalsSubscribed_ = false;

    bool browsing_ = false;
    quint64 generation_ = 0;
    int windowMs_ = 0;
    QString browserPath_;
    QList<QDBusMessage> earlySignals_;
    int pendingResolves_ = 0;
    bool allForNow_ = false;
    QTimer windowTimer_;
};

} // namespace airplay
} // namespace adk
