#include "core/airplay/Errors.hpp"

namespace adk {
namespace airplay {

namespace {

QJsonObject errorObject(const char* domain, const QString& kind, const QString& reason)
{
    QJsonObject obj;
    obj["domain"] = QString::fromLatin1(domain);
    obj["kind"] = kind;
    obj["reason"] = reason;
    return obj;
}

} // namespace

QString DiscoveryError::kindName() const
{
    switch (kind) {
    case None: return QStringLiteral("None");
    case NoNetwork: return QStringLiteral("NoNetwork");
    case Timeout: return QStringLiteral("Timeout");
    case PartialParseFailure: return QStringLiteral("PartialParseFailure");
    }
    return QStringLiteral("Unknown");
}

QJsonObject DiscoveryError::toJson() const
{
    return errorObject("discovery", kindName(), reason);
}

QString PairingError::kindName() const
{
    switch (kind) {
    case None: return QStringLiteral("None");
    case Unreachable: return QStringLiteral("Unreachable");
    case InvalidPin: return QStringLiteral("InvalidPin");
    case TooManyAttempts: return QStringLiteral("TooManyAttempts");
    case Expired: return QStringLiteral("Expired");
    case AlreadyPairing: return QStringLiteral("AlreadyPairing");
    }
    return QStringLiteral("Unknown");
}

QJsonObject PairingError::toJson() const
{
    return errorObject("pairing", kindName(), reason);
}

QString StreamingError::kindName() const
{
    switch (kind) {
    case None: return QStringLiteral("None");
    case NotPaired: return QStringLiteral("NotPaired");
    case AlreadyStreaming: return QStringLiteral("AlreadyStreaming");
    case NotStreaming: return QStringLiteral("NotStreaming");
    case PipelineError: return QStringLiteral("PipelineError");
    case ShutdownTimeout: return QStringLiteral("ShutdownTimeout");
    }
    return QStringLiteral("Unknown");
}

QJsonObject StreamingError::toJson() const
{
    return errorObject("streaming", kindName(), reason);
}

} // namespace airplay
} // namespace adk
