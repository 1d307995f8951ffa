#include "core/airplay/Device.hpp"

namespace adk {
namespace airplay {

QJsonObject Device::toJson() const
{
    QJsonObject obj;
    obj["name"] = name;
    obj["address"] = address;
    obj["port"] = port;
    obj["model"] = model;
    obj["paired"] = paired;
    if (!deviceId.isEmpty())
        obj["device_id"] = deviceId;
    return obj;
}

} // namespace airplay
} // namespace adk
