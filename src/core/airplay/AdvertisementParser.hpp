#pragma once

#include "core/airplay/Device.hpp"
#include "core/airplay/IServiceBrowser.hpp"

namespace adk {
namespace airplay {

/// Normalizes a raw AirPlay advertisement into a Device shape.
class AdvertisementParser {
public:
    /// Returns an invalid Device (see Device::isValid) when the record cannot
    /// be used; *error then holds the reason.
    static Device parse(const RawAdvertisement& ad, QString* error = nullptr);

    /// AirPlay "features" TXT value: either one hex word ("0x5A7FFFF7") or
    /// two comma-separated words (low,high). Returns false if not hexadecimal.
    static bool parseFeatures(const QString& value, quint64* out);
};

} // namespace airplay
} // namespace adk
