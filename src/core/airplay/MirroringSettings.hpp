#pragma once

#include "core/airplay/DiscoveryEngine.hpp"
#include "core/airplay/PairingCoordinator.hpp"
#include "core/airplay/ProcessCapturePipeline.hpp"
#include "core/airplay/StreamingSessionManager.hpp"
#include "core/airplay/SystemProbe.hpp"

namespace adk {

class YamlConfig;

namespace airplay {

/// Every policy knob of the mirroring core, resolved from config.
struct MirroringSettings {
    DiscoveryPolicy discovery;
    PairingPolicy pairing;
    StreamingPolicy streaming;
    PipelineSettings pipeline;
    ProbeSettings probe;
    uint16_t defaultPort = 7000;
    int pairingRequestTimeoutMs = 5000;
    int subscriberQueueDepth = 4;

    static MirroringSettings fromConfig(const YamlConfig& config);
};

} // namespace airplay
} // namespace adk
