#pragma once

#include "core/airplay/IPairingTransport.hpp"
#include <QNetworkAccessManager>
#include <QObject>
#include <QUrl>

class QNetworkReply;

namespace adk {
namespace airplay {

/// IPairingTransport over the receiver's HTTP control port:
///   POST /pair-pin-start   -> receiver shows the PIN
///   POST /pair-setup-pin   -> PIN verification
class HttpPairingTransport : public QObject, public IPairingTransport {
    Q_OBJECT
public:
    explicit HttpPairingTransport(int requestTimeoutMs = 5000, QObject* parent = nullptr);

    void requestChallenge(const DeviceKey& device, Callback callback) override;
    void verifyPin(const DeviceKey& device, const QString& pin, Callback callback) override;

    static QUrl endpoint(const DeviceKey& device, const QString& path);

private:
    void post(const DeviceKey& device, const QString& path, const QByteArray& body,
              Callback callback);
    static Outcome classify(QNetworkReply* reply, QString* detail);

    QNetworkAccessManager network_;
    int requestTimeoutMs_;
};

} // namespace airplay
} // namespace adk
