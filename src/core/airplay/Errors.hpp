#pragma once

#include <QJsonObject>
#include <QString>

namespace adk {
namespace airplay {

// Failure taxonomy shared by the remote operations. Each error carries its kind
// plus a short reason that the panel can show as-is.

struct DiscoveryError {
    enum Kind {
        None = 0,
        NoNetwork,
        Timeout,
        PartialParseFailure
    };

    Kind kind = None;
    QString reason;

    bool isError() const { return kind != None; }
    QString kindName() const;
    QJsonObject toJson() const;
};

struct PairingError {
    enum Kind {
        None = 0,
        Unreachable,
        InvalidPin,
        TooManyAttempts,
        Expired,
        AlreadyPairing
    };

    Kind kind = None;
    QString reason;

    bool isError() const { return kind != None; }
    QString kindName() const;
    QJsonObject toJson() const;
};

struct StreamingError {
    enum Kind {
        None = 0,
        NotPaired,
        AlreadyStreaming,
        NotStreaming,
        PipelineError,
        ShutdownTimeout
    };

    Kind kind = None;
    QString reason;

    bool isError() const { return kind != None; }
    QString kindName() const;
    QJsonObject toJson() const;
};

} // namespace airplay
} // namespace adk
