#pragma once

#include <QString>
#include <QStringList>
#include <QVariant>
#include <cstdint>
#include <yaml-cpp/yaml.h>

namespace adk {

class YamlConfig {
public:
    YamlConfig();

    void load(const QString& filePath);
    void save(const QString& filePath) const;

    // Discovery
    QString serviceType() const;
    int scanTimeoutMs() const;
    int staleTtlMs() const;
    uint16_t defaultPort() const;

    // Pairing
    int pairingMaxAttempts() const;
    int pairingAttemptWindowMs() const;
    int pairingChallengeExpiryMs() const;
    int pairingRequestTimeoutMs() const;

    // Streaming
    int streamStartTimeoutMs() const;
    int streamStopTimeoutMs() const;
    int streamReadyGraceMs() const;
    int streamHealthIntervalMs() const;

    // Pipeline
    QString pipelineProgram() const;
    QStringList pipelineArguments() const;
    int pipelineWidth() const;
    int pipelineHeight() const;
    int pipelineFps() const;

    // IPC
    QString socketPath() const;
    void setSocketPath(const QString& v);
    int subscriberQueueDepth() const;

    // System probes
    QStringList probeTools() const;
    uint16_t connectionTestPort() const;
    int connectionTestTimeoutMs() const;

    // Generic dot-path access (e.g. "pairing.max_attempts")
    QVariant valueByPath(const QString& dottedKey) const;
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

    /// Every scalar leaf of the schema, as dotted paths.
    QStringList scalarPaths() const;

private:
    YAML::Node root_;  // Single source of truth, no shadow state

    void initDefaults();
    static YAML::Node buildDefaultsNode();
};

} // namespace adk
