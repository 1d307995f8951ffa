#include "core/airplay/MirroringSettings.hpp"
#include "core/YamlConfig.hpp"
#include <QDebug>

namespace adk {
namespace airplay {

namespace {

// Out-of-range values keep the built-in default
template <typename T>
T atLeast(const char* key, T value, T minimum, T fallback)
{
    if (value >= minimum)
        return value;
    qWarning() << "[Settings]" << key << "=" << value << "is below" << minimum
               << ", using" << fallback;
    return fallback;
}

} // namespace

MirroringSettings MirroringSettings::fromConfig(const YamlConfig& config)
{
    MirroringSettings s;

    s.discovery.serviceType = config.serviceType();
    s.discovery.scanTimeoutMs = atLeast("discovery.scan_timeout_ms", config.scanTimeoutMs(), 1,
                                        s.discovery.scanTimeoutMs);
    s.discovery.staleTtlMs = atLeast<qint64>("discovery.stale_ttl_ms", config.staleTtlMs(), 1,
                                             s.discovery.staleTtlMs);
    s.defaultPort = atLeast<uint16_t>("discovery.default_port", config.defaultPort(), 1,
                                      s.defaultPort);

    s.pairing.maxAttempts = atLeast("pairing.max_attempts", config.pairingMaxAttempts(), 1,
                                    s.pairing.maxAttempts);
    s.pairing.attemptWindowMs = atLeast<qint64>("pairing.attempt_window_ms",
                                                config.pairingAttemptWindowMs(), 1,
                                                s.pairing.attemptWindowMs);
    s.pairing.challengeExpiryMs = atLeast("pairing.challenge_expiry_ms",
                                          config.pairingChallengeExpiryMs(), 1,
                                          s.pairing.challengeExpiryMs);
    s.pairingRequestTimeoutMs = atLeast("pairing.request_timeout_ms",
                                        config.pairingRequestTimeoutMs(), 1,
                                        s.pairingRequestTimeoutMs);

    s.streaming.startTimeoutMs = atLeast("streaming.start_timeout_ms",
                                         config.streamStartTimeoutMs(), 1,
                                         s.streaming.startTimeoutMs);
    s.streaming.stopTimeoutMs = atLeast("streaming.stop_timeout_ms", config.streamStopTimeoutMs(),
                                        1, s.streaming.stopTimeoutMs);
    // Below this the health timer would spin
    s.streaming.healthIntervalMs = atLeast("streaming.health_interval_ms",
                                           config.streamHealthIntervalMs(), 50,
                                           s.streaming.healthIntervalMs);

    s.pipeline.program = config.pipelineProgram();
    s.pipeline.arguments = config.pipelineArguments();
    s.pipeline.width = atLeast("pipeline.width", config.pipelineWidth(), 1, s.pipeline.width);
    s.pipeline.height = atLeast("pipeline.height", config.pipelineHeight(), 1, s.pipeline.height);
    s.pipeline.fps = atLeast("pipeline.fps", config.pipelineFps(), 1, s.pipeline.fps);
    s.pipeline.readyGraceMs = atLeast("streaming.ready_grace_ms", config.streamReadyGraceMs(), 0,
                                      s.pipeline.readyGraceMs);

    s.probe.tools = config.probeTools();
    s.probe.captureProgram = s.pipeline.program;
    s.probe.connectionTestPort = atLeast<uint16_t>("system.connection_test_port",
                                                   config.connectionTestPort(), 1,
                                                   s.probe.connectionTestPort);
    s.probe.connectionTestTimeoutMs = atLeast("system.connection_test_timeout_ms",
                                              config.connectionTestTimeoutMs(), 1,
                                              s.probe.connectionTestTimeoutMs);

    s.subscriberQueueDepth = atLeast("ipc.subscriber_queue_depth", config.subscriberQueueDepth(),
                                     1, s.subscriberQueueDepth);
    return s;
}

} // namespace airplay
} // namespace adk
