#pragma once

#include "core/airplay/Device.hpp"
#include <QString>
#include <functional>

namespace adk {
namespace airplay {

/// Talks to a receiver's pairing endpoint. The cryptographic exchange behind
/// verifyPin() belongs to the implementation; callers only see the outcome.
class IPairingTransport {
public:
    enum class Outcome {
        Accepted,
        Rejected,
        Unreachable
    };

    using Callback = std::function<void(Outcome outcome, const QString& detail)>;

    virtual ~IPairingTransport() = default;

    /// Ask the receiver to show its PIN challenge. Accepted or Unreachable.
    virtual void requestChallenge(const DeviceKey& device, Callback callback) = 0;

    /// Submit a PIN for the challenge currently displayed by the receiver.
    virtual void verifyPin(const DeviceKey& device, const QString& pin, Callback callback) = 0;
};

} // namespace airplay
} // namespace adk
