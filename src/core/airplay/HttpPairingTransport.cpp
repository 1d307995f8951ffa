#include "core/airplay/HttpPairingTransport.hpp"
#include <QDebug>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>

namespace adk {
namespace airplay {

static const QByteArray kUserAgent = QByteArrayLiteral("AirPlay/320.20");

HttpPairingTransport::HttpPairingTransport(int requestTimeoutMs, QObject* parent)
    : QObject(parent)
    , requestTimeoutMs_(requestTimeoutMs)
{
}

QUrl HttpPairingTransport::endpoint(const DeviceKey& device, const QString& path)
{
    QUrl url;
    url.setScheme(QStringLiteral("http"));
    // QUrl brackets IPv6 hosts itself
    url.setHost(device.address);
    url.setPort(device.port);
    url.setPath(path);
    return url;
}

void HttpPairingTransport::requestChallenge(const DeviceKey& device, Callback callback)
{
    qInfo() << "[PairingHttp] Requesting PIN challenge from" << device.toString();
    post(device, QStringLiteral("/pair-pin-start"), QByteArray(), std::move(callback));
}

void HttpPairingTransport::verifyPin(const DeviceKey& device, const QString& pin, Callback callback)
{
    qInfo() << "[PairingHttp] Submitting PIN to" << device.toString();
    post(device, QStringLiteral("/pair-setup-pin"), pin.toUtf8(), std::move(callback));
}

void HttpPairingTransport::post(const DeviceKey& device, const QString& path,
                                const QByteArray& body, Callback callback)
{
    QNetworkRequest request(endpoint(device, path));
    request.setHeader(QNetworkRequest::UserAgentHeader, kUserAgent);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QByteArrayLiteral("application/octet-stream"));
    request.setTransferTimeout(requestTimeoutMs_);

    QNetworkReply* reply = network_.post(request, body);
    connect(reply, &QNetworkReply::finished, this, [reply, callback = std::move(callback)]() {
        reply->deleteLater();
        QString detail;
        Outcome outcome = classify(reply, &detail);
        if (callback)
            callback(outcome, detail);
    });
}

IPairingTransport::Outcome HttpPairingTransport::classify(QNetworkReply* reply, QString* detail)
{
    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();

    if (status >= 200 && status < 300) {
        *detail = QString();
        return Outcome::Accepted;
    }
    // 470 = Connection Authorization Required, what receivers answer to a wrong PIN
    if (status == 401 || status == 403 || status == 470) {
        *detail = QStringLiteral("Receiver rejected the PIN (HTTP %1)").arg(status);
        return Outcome::Rejected;
    }
    if (status != 0) {
        *detail = QStringLiteral("Receiver answered HTTP %1").arg(status);
        return Outcome::Unreachable;
    }
    *detail = reply->errorString();
    return Outcome::Unreachable;
}

} // namespace airplay
} // namespace adk
