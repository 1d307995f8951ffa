#pragma once

#include <QHash>
#include <QJsonObject>
#include <QJsonValue>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>

namespace adk {

class IConfigService;

namespace airplay {
class MirroringOrchestrator;
}

/// Unix domain socket IPC server for the Decky panel backend.
///
/// Newline-delimited JSON. Requests are {"id", "command", "data"}; every
/// request gets exactly one {"id", "result"[, "error"]} line back, possibly
/// after other replies when the command is asynchronous. Every connected
/// client also receives {"event": "streaming_status_changed", "data": ...}
/// lines through its own Status Broadcaster subscription.
class IpcServer : public QObject {
    Q_OBJECT

public:
    explicit IpcServer(QObject* parent = nullptr);
    ~IpcServer() override;

    /// Start listening. Returns false if socket already in use.
    bool start(const QString& socketPath = QStringLiteral("/tmp/airdecky.sock"));
    void stop();

    bool isListening() const { return server_ != nullptr; }
    int clientCount() const { return clients_.size(); }

    // Inject dependencies
    void setOrchestrator(airplay::MirroringOrchestrator* orchestrator);
    void setConfigService(IConfigService* config);

private slots:
    void onNewConnection();
    void onReadyRead();
    void onDisconnected();

private:
    struct Client {
        QByteArray buffer;
        int subscriptionId = 0;
    };

    void handleLine(QLocalSocket* socket, const QByteArray& line);
    void dispatch(QLocalSocket* socket, const QJsonValue& id, const QString& command,
                  const QJsonObject& data);

    void handleDiscoverDevices(QLocalSocket* socket, const QJsonValue& id);
    void handleBeginPairing(QLocalSocket* socket, const QJsonValue& id, const QJsonObject& data);
    void handlePairDevice(QLocalSocket* socket, const QJsonValue& id, const QJsonObject& data);
    void handleStartStreaming(QLocalSocket* socket, const QJsonValue& id, const QJsonObject& data);
    void handleStopStreaming(QLocalSocket* socket, const QJsonValue& id);
    void handleTestConnection(QLocalSocket* socket, const QJsonValue& id, const QJsonObject& data);
    QJsonObject handleGetConfig() const;
    QJsonObject handleSetConfig(const QJsonObject& data);

    void reply(QLocalSocket* socket, const QJsonValue& id, const QJsonValue& result,
               const QJsonObject& error = QJsonObject());
    static void writeLine(QLocalSocket* socket, const QJsonObject& obj);
    static QJsonObject ipcError(const QString& kind, const QString& reason);

    QLocalServer* server_ = nullptr;
    QHash<QLocalSocket*, Client> clients_;
    airplay::MirroringOrchestrator* orchestrator_ = nullptr;
    IConfigService* config_ = nullptr;
};

} // namespace adk
