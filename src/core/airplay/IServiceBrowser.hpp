#pragma once

#include <QMap>
#include <QMetaType>
#include <QObject>
#include <QString>
#include <cstdint>

namespace adk {
namespace airplay {

/// One resolved service-discovery record, exactly as the network reported it.
struct RawAdvertisement {
    QString name;
    QString host;
    QString address;
    uint16_t port = 0;
    QMap<QString, QString> txt;
};

/// Network service-discovery provider. One browse at a time; the caller
/// (DiscoveryEngine) coalesces concurrent requests.
class IServiceBrowser : public QObject {
    Q_OBJECT
public:
    enum class Failure {
        NoNetwork,
        Timeout
    };
    Q_ENUM(Failure)

    using QObject::QObject;
    ~IServiceBrowser() override = default;

    /// Start browsing for serviceType. Emits advertisement() per resolved
    /// record and exactly one of finished()/failed() when the window closes.
    virtual void browse(const QString& serviceType, int windowMs) = 0;

    /// Abort the running browse. No further signals are emitted for it.
    virtual void cancel() = 0;

    virtual bool isBrowsing() const = 0;

signals:
    void advertisement(const adk::airplay::RawAdvertisement& ad);
    void finished();
    void failed(adk::airplay::IServiceBrowser::Failure reason, const QString& message);
};

} // namespace airplay
} // namespace adk

Q_DECLARE_METATYPE(adk::airplay::RawAdvertisement)
