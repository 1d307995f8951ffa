#include "core/airplay/AdvertisementParser.hpp"
#include <QHostAddress>
#include <QStringList>
#include <boost/log/trivial.hpp>

namespace adk {
namespace airplay {

namespace {

Device reject(const RawAdvertisement& ad, const QString& reason, QString* error)
{
    BOOST_LOG_TRIVIAL(warning) << "[Parser] Skipping advertisement '" << ad.name.toStdString()
                               << "': " << reason.toStdString();
    if (error)
        *error = reason;
    return {};
}

bool parseHexWord(QString word, quint64* out)
{
    word = word.trimmed();
    if (word.startsWith(QLatin1String("0x"), Qt::CaseInsensitive))
        word = word.mid(2);
    if (word.isEmpty())
        return false;
    bool ok = false;
    quint64 v = word.toULongLong(&ok, 16);
    if (ok)
        *out = v;
    return ok;
}

} // namespace

bool AdvertisementParser::parseFeatures(const QString& value, quint64* out)
{
    const QStringList words = value.split(QLatin1Char(','));
    if (words.isEmpty() || words.size() > 2)
        return false;

    quint64 low = 0;
    if (!parseHexWord(words.at(0), &low))
        return false;

    quint64 high = 0;
    if (words.size() == 2 && !parseHexWord(words.at(1), &high))
        return false;

    *out = (high << 32) | (low & 0xFFFFFFFFULL);
    return true;
}

Device AdvertisementParser::parse(const RawAdvertisement& ad, QString* error)
{
    if (ad.port == 0)
        return reject(ad, QStringLiteral("missing port"), error);

    QHostAddress host;
    QString address = ad.address.trimmed();
    // Avahi reports link-local IPv6 as "fe80::1%wlan0"; QHostAddress keeps the scope.
    if (address.isEmpty() || !host.setAddress(address))
        return reject(ad, QStringLiteral("invalid address '%1'").arg(ad.address), error);

    Device dev;
    dev.address = host.protocol() == QAbstractSocket::IPv6Protocol && host.toIPv4Address() != 0
        ? QHostAddress(host.toIPv4Address()).toString()
        : address;
    dev.port = ad.port;
    dev.name = ad.name.trimmed().isEmpty() ? ad.host : ad.name.trimmed();
    if (dev.name.isEmpty())
        return reject(ad, QStringLiteral("no instance or host name"), error);

    dev.model = ad.txt.value(QStringLiteral("model"));
    if (dev.model.isEmpty())
        dev.model = ad.txt.value(QStringLiteral("am"));
    if (dev.model.isEmpty())
        dev.model = QStringLiteral("Unknown");

    dev.deviceId = ad.txt.value(QStringLiteral("deviceid"));

    const auto features = ad.txt.constFind(QStringLiteral("features"));
    if (features != ad.txt.constEnd() && !parseFeatures(features.value(), &dev.features))
        return reject(ad, QStringLiteral("malformed features '%1'").arg(features.value()), error);

    BOOST_LOG_TRIVIAL(debug) << "[Parser] " << dev.name.toStdString() << " -> "
                             << dev.address.toStdString() << ":" << dev.port
                             << " model=" << dev.model.toStdString();
    return dev;
}

} // namespace airplay
} // namespace adk
