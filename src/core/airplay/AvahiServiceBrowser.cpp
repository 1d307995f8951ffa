#include "core/airplay/AvahiServiceBrowser.hpp"
#include <QDBusArgument>
#include <QDBusConnectionInterface>
#include <QDBusError>
#include <QDBusObjectPath>
#include <QDBusPendingCall>
#include <QDBusPendingCallWatcher>
#include <QDBusPendingReply>
#include <QDebug>

namespace adk {
namespace airplay {

namespace {

const QString kAvahiService = QStringLiteral("org.freedesktop.Avahi");
const QString kServerInterface = QStringLiteral("org.freedesktop.Avahi.Server");
const QString kBrowserInterface = QStringLiteral("org.freedesktop.Avahi.ServiceBrowser");

// avahi-common/address.h / defs.h
constexpr int kIfUnspec = -1;
constexpr int kProtoUnspec = -1;
constexpr int kProtoInet = 0;

} // namespace

AvahiServiceBrowser::AvahiServiceBrowser(QObject* parent)
    : AvahiServiceBrowser(QDBusConnection::systemBus(), parent)
{
}

AvahiServiceBrowser::AvahiServiceBrowser(const QDBusConnection& bus, QObject* parent)
    : IServiceBrowser(parent)
    , bus_(bus)
{
    windowTimer_.setSingleShot(true);
    connect(&windowTimer_, &QTimer::timeout, this, [this]() {
        if (!browsing_) return;
        if (browserPath_.isEmpty()) {
            fail(Failure::Timeout, QStringLiteral("Avahi did not create a service browser in time"));
            return;
        }
        qInfo() << "[Avahi] Browse window elapsed," << pendingResolves_
                << "resolution(s) still pending";
        finish();
    });
}

AvahiServiceBrowser::~AvahiServiceBrowser()
{
    cancel();
}

void AvahiServiceBrowser::subscribeSignals()
{
    if (signalsSubscribed_) return;

    // Empty path = match every browser object; filtered by path in the slots
    bool ok = bus_.connect(kAvahiService, QString(), kBrowserInterface, QStringLiteral("ItemNew"),
                           this, SLOT(onItemNew(QDBusMessage)));
    ok = bus_.connect(kAvahiService, QString(), kBrowserInterface, QStringLiteral("Failure"),
                      this, SLOT(onBrowserFailure(QDBusMessage))) && ok;
    ok = bus_.connect(kAvahiService, QString(), kBrowserInterface, QStringLiteral("AllForNow"),
                      this, SLOT(onAllForNow(QDBusMessage))) && ok;
    if (!ok)
        qWarning() << "[Avahi] Could not subscribe to ServiceBrowser signals:" << bus_.lastError().message();
    signalsSubscribed_ = ok;
}

void AvahiServiceBrowser::browse(const QString& serviceType, int windowMs)
{
    if (browsing_)
        cancel();

    ++generation_;
    browsing_ = true;
    windowMs_ = windowMs;
    browserPath_.clear();
    earlySignals_.clear();
    pendingResolves_ = 0;
    allForNow_ = false;

    if (!bus_.isConnected()) {
        fail(Failure::NoNetwork, QStringLiteral("System D-Bus is not available"));
        return;
    }

    auto* iface = bus_.interface();
    if (iface && !iface->isServiceRegistered(kAvahiService).value()) {
        fail(Failure::NoNetwork, QStringLiteral("Avahi daemon is not running"));
        return;
    }

    subscribeSignals();
    windowTimer_.start(windowMs);

    QDBusMessage call = QDBusMessage::createMethodCall(
        kAvahiService, QStringLiteral("/"), kServerInterface, QStringLiteral("ServiceBrowserNew"));
    call << kIfUnspec << kProtoUnspec << serviceType << QString() << uint(0);

    const quint64 generation = generation_;
    auto* watcher = new QDBusPendingCallWatcher(bus_.asyncCall(call, windowMs), this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [this, watcher, generation]() {
        watcher->deleteLater();
        QDBusPendingReply<QDBusObjectPath> reply = *watcher;

        if (generation != generation_ || !browsing_) {
            // Browse was cancelled while the call was pending; release the orphan
            if (!reply.isError()) {
                bus_.asyncCall(QDBusMessage::createMethodCall(
                    kAvahiService, reply.value().path(), kBrowserInterface, QStringLiteral("Free")));
            }
            return;
        }

        if (reply.isError()) {
            const auto type = reply.error().type();
            if (type == QDBusError::NoReply || type == QDBusError::Timeout) {
                fail(Failure::Timeout, reply.error().message());
            } else {
                fail(Failure::NoNetwork, reply.error().message());
            }
            return;
        }

        onBrowserCreated(reply.value().path());
    });
}

void AvahiServiceBrowser::onBrowserCreated(const QString& path)
{
    browserPath_ = path;
    qDebug() << "[Avahi] Browser created at" << path;

    QList<QDBusMessage> early;
    early.swap(earlySignals_);
    for (const auto& msg : early) {
        if (!browsing_) return;
        if (msg.path() != browserPath_) continue;

        if (msg.member() == QLatin1String("ItemNew"))
            handleItemNew(msg);
        else if (msg.member() == QLatin1String("Failure"))
            onBrowserFailure(msg);
        else if (msg.member() == QLatin1String("AllForNow"))
            onAllForNow(msg);
    }
}

void AvahiServiceBrowser::onItemNew(const QDBusMessage& msg)
{
    if (!browsing_) return;
    if (browserPath_.isEmpty()) {
        earlySignals_.append(msg);
        return;
    }
    if (msg.path() != browserPath_) return;
    handleItemNew(msg);
}

void AvahiServiceBrowser::handleItemNew(const QDBusMessage& msg)
{
    const QList<QVariant> args = msg.arguments();
    if (args.size() < 5) {
        qWarning() << "[Avahi] Malformed ItemNew signal";
        return;
    }
    resolve(args.at(0).toInt(), args.at(1).toInt(), args.at(2).toString(),
            args.at(3).toString(), args.at(4).toString());
}

void AvahiServiceBrowser::resolve(int interface, int protocol, const QString& name,
                                  const QString& type, const QString& domain)
{
    QDBusMessage call = QDBusMessage::createMethodCall(
        kAvahiService, QStringLiteral("/"), kServerInterface, QStringLiteral("ResolveService"));
    // aprotocol INET: one IPv4 address per receiver so duplicate sightings share a key
    call << interface << protocol << name << type << domain << kProtoInet << uint(0);

    ++pendingResolves_;
    const quint64 generation = generation_;
    auto* watcher = new QDBusPendingCallWatcher(bus_.asyncCall(call, windowMs_), this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [this, watcher, generation, name]() {
        watcher->deleteLater();
        if (generation != generation_ || !browsing_)
            return;
        --pendingResolves_;

        const QDBusMessage reply = watcher->reply();
        if (reply.type() != QDBusMessage::ReplyMessage || reply.arguments().size() < 10) {
            qDebug() << "[Avahi] Could not resolve" << name << ":" << watcher->error().message();
            finishIfDrained();
            return;
        }

        // (i iface, i proto, s name, s type, s domain, s host, i aproto, s address, q port, aay txt, u flags)
        const QList<QVariant> args = reply.arguments();
        RawAdvertisement ad;
        ad.name = args.at(2).toString();
        ad.host = args.at(5).toString();
        ad.address = args.at(7).toString();
        ad.port = static_cast<uint16_t>(args.at(8).toUInt());

        const QDBusArgument txt = args.at(9).value<QDBusArgument>();
        txt.beginArray();
        while (!txt.atEnd()) {
            QByteArray entry;
            txt >> entry;
            const int eq = entry.indexOf('=');
            if (eq <= 0) {
                ad.txt.insert(QString::fromUtf8(entry).toLower(), QString());
            } else {
                ad.txt.insert(QString::fromUtf8(entry.left(eq)).toLower(),
                              QString::fromUtf8(entry.mid(eq + 1)));
            }
        }
        txt.endArray();

        emit advertisement(ad);
        finishIfDrained();
    });
}

void AvahiServiceBrowser::onBrowserFailure(const QDBusMessage& msg)
{
    if (!browsing_) return;
    if (browserPath_.isEmpty()) {
        earlySignals_.append(msg);
        return;
    }
    if (msg.path() != browserPath_) return;

    const QString reason = msg.arguments().value(0).toString();
    fail(Failure::NoNetwork, reason.isEmpty() ? QStringLiteral("Avahi browser failure") : reason);
}

void AvahiServiceBrowser::onAllForNow(const QDBusMessage& msg)
{
    if (!browsing_) return;
    if (browserPath_.isEmpty()) {
        earlySignals_.append(msg);
        return;
    }
    if (msg.path() != browserPath_) return;

    allForNow_ = true;
    finishIfDrained();
}

void AvahiServiceBrowser::finishIfDrained()
{
    if (browsing_ && allForNow_ && pendingResolves_ == 0)
        finish();
}

void AvahiServiceBrowser::finish()
{
    teardown();
    emit finished();
}

void AvahiServiceBrowser::fail(Failure reason, const QString& message)
{
    qWarning() << "[Avahi] Browse failed:" << message;
    teardown();
    emit failed(reason, message);
}

void AvahiServiceBrowser::cancel()
{
    if (!browsing_) return;
    qDebug() << "[Avahi] Browse cancelled";
    teardown();
}

void AvahiServiceBrowser::teardown()
{
    windowTimer_.stop();
    if (!browserPath_.isEmpty() && bus_.isConnected()) {
        bus_.asyncCall(QDBusMessage::createMethodCall(
            kAvahiService, browserPath_, kBrowserInterface, QStringLiteral("Free")));
    }
    browserPath_.clear();
    earlySignals_.clear();
    pendingResolves_ = 0;
    allForNow_ = false;
    browsing_ = false;
    ++generation_;
}

} // namespace airplay
} // namespace adk
