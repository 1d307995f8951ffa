#include "core/YamlConfig.hpp"
#include "core/YamlMerge.hpp"
#include <QDir>
#include <QFileInfo>
#include <fstream>

namespace adk {

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["discovery"]["service_type"] = "_airplay._tcp";
    root_["discovery"]["scan_timeout_ms"] = 5000;
    root_["discovery"]["stale_ttl_ms"] = 60000;
    root_["discovery"]["default_port"] = 7000;

    root_["pairing"]["max_attempts"] = 3;
    root_["pairing"]["attempt_window_ms"] = 120000;
    root_["pairing"]["challenge_expiry_ms"] = 60000;
    root_["pairing"]["request_timeout_ms"] = 5000;

    root_["streaming"]["start_timeout_ms"] = 10000;
    root_["streaming"]["stop_timeout_ms"] = 5000;
    root_["streaming"]["ready_grace_ms"] = 1500;
    root_["streaming"]["health_interval_ms"] = 1000;

    root_["pipeline"]["program"] = "gst-launch-1.0";
    YAML::Node args(YAML::NodeType::Sequence);
    for (const char* arg : {"-e", "ximagesrc", "use-damage=false", "!",
                            "video/x-raw,framerate={fps}/1", "!", "videoscale", "!",
                            "video/x-raw,width={width},height={height}", "!", "videoconvert", "!",
                            "x264enc", "tune=zerolatency", "speed-preset=ultrafast", "!",
                            "h264parse", "!", "mpegtsmux", "!",
                            "tcpclientsink", "host={address}", "port={port}"})
        args.push_back(arg);
    root_["pipeline"]["arguments"] = args;
    root_["pipeline"]["width"] = 1280;
    root_["pipeline"]["height"] = 800;
    root_["pipeline"]["fps"] = 30;

    root_["ipc"]["socket_path"] = "/tmp/airdecky.sock";
    root_["ipc"]["subscriber_queue_depth"] = 4;

    YAML::Node tools(YAML::NodeType::Sequence);
    tools.push_back("ffmpeg");
    tools.push_back("gst-launch-1.0");
    tools.push_back("xwininfo");
    root_["system"]["probe_tools"] = tools;
    root_["system"]["connection_test_port"] = 7000;
    root_["system"]["connection_test_timeout_ms"] = 3000;
}

void YamlConfig::load(const QString& filePath)
{
    YAML::Node defaults;
    initDefaults();
    defaults = YAML::Clone(root_);

    YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
    root_ = mergeYaml(defaults, loaded);
}

void YamlConfig::save(const QString& filePath) const
{
    QDir().mkpath(QFileInfo(filePath).absolutePath());
    std::ofstream fout(filePath.toStdString());
    fout << root_;
}

static QString str(const YAML::Node& node, const char* fallback)
{
    return QString::fromStdString(node.as<std::string>(fallback));
}

static QStringList strList(const YAML::Node& node)
{
    QStringList out;
    if (!node.IsSequence()) return out;
    for (const auto& item : node)
        out << QString::fromStdString(item.as<std::string>(""));
    return out;
}

static uint16_t port(const YAML::Node& node, uint16_t fallback)
{
    int v = node.as<int>(fallback);
    if (v <= 0 || v > 65535) return fallback;
    return static_cast<uint16_t>(v);
}

// --- Discovery ---

QString YamlConfig::serviceType() const
{
    return str(root_["discovery"]["service_type"], "_airplay._tcp");
}

int YamlConfig::scanTimeoutMs() const
{
    return root_["discovery"]["scan_timeout_ms"].as<int>(5000);
}

int YamlConfig::staleTtlMs() const
{
    return root_["discovery"]["stale_ttl_ms"].as<int>(60000);
}

uint16_t YamlConfig::defaultPort() const
{
    return port(root_["discovery"]["default_port"], 7000);
}

// --- Pairing ---

int YamlConfig::pairingMaxAttempts() const
{
    return root_["pairing"]["max_attempts"].as<int>(3);
}

int YamlConfig::pairingAttemptWindowMs() const
{
    return root_["pairing"]["attempt_window_ms"].as<int>(120000);
}

int YamlConfig::pairingChallengeExpiryMs() const
{
    return root_["pairing"]["challenge_expiry_ms"].as<int>(60000);
}

int YamlConfig::pairingRequestTimeoutMs() const
{
    return root_["pairing"]["request_timeout_ms"].as<int>(5000);
}

// --- Streaming ---

int YamlConfig::streamStartTimeoutMs() const
{
    return root_["streaming"]["start_timeout_ms"].as<int>(10000);
}

int YamlConfig::streamStopTimeoutMs() const
{
    return root_["streaming"]["stop_timeout_ms"].as<int>(5000);
}

int YamlConfig::streamReadyGraceMs() const
{
    return root_["streaming"]["ready_grace_ms"].as<int>(1500);
}

int YamlConfig::streamHealthIntervalMs() const
{
    return root_["streaming"]["health_interval_ms"].as<int>(1000);
}

// --- Pipeline ---

QString YamlConfig::pipelineProgram() const
{
    return str(root_["pipeline"]["program"], "gst-launch-1.0");
}

QStringList YamlConfig::pipelineArguments() const
{
    return strList(root_["pipeline"]["arguments"]);
}

int YamlConfig::pipelineWidth() const
{
    return root_["pipeline"]["width"].as<int>(1280);
}

int YamlConfig::pipelineHeight() const
{
    return root_["pipeline"]["height"].as<int>(800);
}

int YamlConfig::pipelineFps() const
{
    return root_["pipeline"]["fps"].as<int>(30);
}

// --- IPC ---

QString YamlConfig::socketPath() const
{
    return str(root_["ipc"]["socket_path"], "/tmp/airdecky.sock");
}

void YamlConfig::setSocketPath(const QString& v)
{
    root_["ipc"]["socket_path"] = v.toStdString();
}

int YamlConfig::subscriberQueueDepth() const
{
    return root_["ipc"]["subscriber_queue_depth"].as<int>(4);
}

// --- System probes ---

QStringList YamlConfig::probeTools() const
{
    return strList(root_["system"]["probe_tools"]);
}

uint16_t YamlConfig::connectionTestPort() const
{
    return port(root_["system"]["connection_test_port"], 7000);
}

int YamlConfig::connectionTestTimeoutMs() const
{
    return root_["system"]["connection_test_timeout_ms"].as<int>(3000);
}

// --- Generic dot-path access ---

static QVariant yamlScalarToVariant(const YAML::Node& node)
{
    if (!node.IsScalar()) return {};

    const std::string s = node.Scalar();

    if (s == "true") return QVariant(true);
    if (s == "false") return QVariant(false);

    bool intOk = false;
    int i = QString::fromStdString(s).toInt(&intOk);
    if (intOk) return QVariant(i);

    bool dblOk = false;
    double d = QString::fromStdString(s).toDouble(&dblOk);
    if (dblOk) return QVariant(d);

    return QVariant(QString::fromStdString(s));
}

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty()) return {};

    QStringList parts = dottedKey.split('.');

    YAML::Node node = YAML::Clone(root_);
    for (const auto& part : parts) {
        if (!node.IsMap()) return {};
        node.reset(node[part.toStdString()]);
        if (!node.IsDefined() || node.IsNull()) return {};
    }

    return yamlScalarToVariant(node);
}

YAML::Node YamlConfig::buildDefaultsNode()
{
    YamlConfig tmp;
    return YAML::Clone(tmp.root_);
}

bool YamlConfig::setValueByPath(const QString& dottedKey, const QVariant& value)
{
    if (dottedKey.isEmpty()) return false;

    QStringList parts = dottedKey.split('.');

    // Validate against DEFAULTS tree, not merged root_
    // Path must exist AND resolve to a scalar (leaf) node. Writes to maps/sequences are rejected
    {
        YAML::Node defaults = buildDefaultsNode();
        for (const auto& part : parts) {
            if (!defaults.IsMap()) return false;
            defaults.reset(defaults[part.toStdString()]);
            if (!defaults.IsDefined()) return false;
        }
        if (!defaults.IsScalar()) return false;
    }

    // Path exists in schema; navigate the real tree and set the value
    YAML::Node node = root_;
    for (int i = 0; i < parts.size() - 1; ++i) {
        if (!node.IsMap()) return false;
        node.reset(node[parts[i].toStdString()]);
    }

    std::string leafKey = parts.last().toStdString();
    switch (value.typeId()) {
    case QMetaType::Bool:
        node[leafKey] = value.toBool();
        break;
    case QMetaType::Int:
    case QMetaType::LongLong:
        node[leafKey] = value.toLongLong();
        break;
    case QMetaType::Double:
    case QMetaType::Float:
        node[leafKey] = value.toDouble();
        break;
    default:
        node[leafKey] = value.toString().toStdString();
        break;
    }

    return true;
}

static void collectScalarPaths(const YAML::Node& node, const QString& prefix, QStringList* out)
{
    for (auto it = node.begin(); it != node.end(); ++it) {
        const QString key = QString::fromStdString(it->first.as<std::string>());
        const QString path = prefix.isEmpty() ? key : prefix + QLatin1Char('.') + key;
        if (it->second.IsMap())
            collectScalarPaths(it->second, path, out);
        else if (it->second.IsScalar())
            out->append(path);
    }
}

QStringList YamlConfig::scalarPaths() const
{
    QStringList paths;
    collectScalarPaths(buildDefaultsNode(), QString(), &paths);
    return paths;
}

} // namespace adk
