#include "IpcServer.hpp"
#include "IConfigService.hpp"
#include "core/airplay/MirroringOrchestrator.hpp"
#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QPointer>

namespace adk {

using airplay::Device;
using airplay::MirroringOrchestrator;

// A client that never sends a newline must not grow the buffer forever
static constexpr int kMaxLineBytes = 64 * 1024;

IpcServer::IpcServer(QObject* parent)
    : QObject(parent)
{
}

IpcServer::~IpcServer()
{
    stop();
}

bool IpcServer::start(const QString& socketPath)
{
    if (server_) return false;

    // Remove stale socket file
    QFile::remove(socketPath);

    server_ = new QLocalServer(this);
    server_->setSocketOptions(QLocalServer::UserAccessOption);

    connect(server_, &QLocalServer::newConnection, this, &IpcServer::onNewConnection);

    if (!server_->listen(socketPath)) {
        qWarning() << "[IpcServer] Failed to listen on" << socketPath
                   << ":" << server_->errorString();
        delete server_;
        server_ = nullptr;
        return false;
    }

    qInfo() << "[IpcServer] Listening on" << socketPath;
    return true;
}

void IpcServer::stop()
{
    const auto sockets = clients_.keys();
    for (QLocalSocket* socket : sockets) {
        if (orchestrator_)
            orchestrator_->broadcaster()->unsubscribe(clients_.value(socket).subscriptionId);
        socket->disconnect(this);
        socket->abort();
        socket->deleteLater();
    }
    clients_.clear();

    if (server_) {
        server_->close();
        delete server_;
        server_ = nullptr;
    }
}

void IpcServer::setOrchestrator(MirroringOrchestrator* orchestrator)
{
    orchestrator_ = orchestrator;
}

void IpcServer::setConfigService(IConfigService* config)
{
    config_ = config;
}

void IpcServer::onNewConnection()
{
    while (auto* socket = server_->nextPendingConnection()) {
        connect(socket, &QLocalSocket::readyRead, this, &IpcServer::onReadyRead);
        connect(socket, &QLocalSocket::disconnected, this, &IpcServer::onDisconnected);

        Client client;
        if (orchestrator_) {
            QPointer<QLocalSocket> guard(socket);
            client.subscriptionId = orchestrator_->broadcaster()->subscribe(
                [guard](const airplay::StatusSnapshot& snapshot) {
                    if (!guard) return;
                    QJsonObject event;
                    event["event"] = QStringLiteral("streaming_status_changed");
                    event["data"] = snapshot.toJson();
                    writeLine(guard, event);
                }, socket);
        }
        clients_.insert(socket, client);
        qDebug() << "[IpcServer] Client connected," << clients_.size() << "total";
    }
}

void IpcServer::onReadyRead()
{
    auto* socket = qobject_cast<QLocalSocket*>(sender());
    if (!socket) return;

    auto it = clients_.find(socket);
    if (it == clients_.end()) return;

    it->buffer.append(socket->readAll());

    int newline;
    while ((newline = it->buffer.indexOf('\n')) >= 0) {
        const QByteArray line = it->buffer.left(newline).trimmed();
        it->buffer.remove(0, newline + 1);
        if (!line.isEmpty())
            handleLine(socket, line);

        // handleLine may answer synchronously and the client may be gone
        it = clients_.find(socket);
        if (it == clients_.end()) return;
    }

    if (it->buffer.size() > kMaxLineBytes) {
        qWarning() << "[IpcServer] Dropping oversized request from client";
        it->buffer.clear();
        reply(socket, QJsonValue(), false, ipcError(QStringLiteral("InvalidRequest"),
                                                    QStringLiteral("Request too large")));
    }
}

void IpcServer::onDisconnected()
{
    auto* socket = qobject_cast<QLocalSocket*>(sender());
    if (!socket) return;

    auto it = clients_.find(socket);
    if (it != clients_.end()) {
        if (orchestrator_)
            orchestrator_->broadcaster()->unsubscribe(it->subscriptionId);
        clients_.erase(it);
    }
    socket->deleteLater();
}

void IpcServer::handleLine(QLocalSocket* socket, const QByteArray& line)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(line, &parseError);
    if (!doc.isObject()) {
        reply(socket, QJsonValue(), false,
              ipcError(QStringLiteral("InvalidRequest"), QStringLiteral("Invalid JSON")));
        return;
    }

    QJsonObject obj = doc.object();
    dispatch(socket, obj.value("id"), obj.value("command").toString(),
             obj.value("data").toObject());
}

void IpcServer::dispatch(QLocalSocket* socket, const QJsonValue& id, const QString& command,
                         const QJsonObject& data)
{
    if (command == QLatin1String("get_config")) {
        reply(socket, id, handleGetConfig());
        return;
    }
    if (command == QLatin1String("set_config")) {
        QJsonObject out = handleSetConfig(data);
        reply(socket, id, out.value("result"), out.value("error").toObject());
        return;
    }

    if (!orchestrator_) {
        reply(socket, id, false, ipcError(QStringLiteral("Unavailable"),
                                          QStringLiteral("Mirroring core not initialised")));
        return;
    }

    if (command == QLatin1String("discover_devices"))
        handleDiscoverDevices(socket, id);
    else if (command == QLatin1String("list_devices")) {
        QJsonArray devices;
        for (const Device& dev : orchestrator_->listDevices())
            devices.append(dev.toJson());
        reply(socket, id, devices);
    }
    else if (command == QLatin1String("begin_pairing"))
        handleBeginPairing(socket, id, data);
    else if (command == QLatin1String("pair_device"))
        handlePairDevice(socket, id, data);
    else if (command == QLatin1String("start_streaming"))
        handleStartStreaming(socket, id, data);
    else if (command == QLatin1String("stop_streaming"))
        handleStopStreaming(socket, id);
    else if (command == QLatin1String("get_streaming_status"))
        reply(socket, id, orchestrator_->streamingStatus().toJson());
    else if (command == QLatin1String("test_device_connection"))
        handleTestConnection(socket, id, data);
    else if (command == QLatin1String("check_screen_capture_available"))
        reply(socket, id, orchestrator_->screenCaptureAvailable());
    else if (command == QLatin1String("get_system_info"))
        reply(socket, id, orchestrator_->systemInfo());
    else
        reply(socket, id, false, ipcError(QStringLiteral("UnknownCommand"),
                                          QStringLiteral("Unknown command: %1").arg(command)));
}

void IpcServer::handleDiscoverDevices(QLocalSocket* socket, const QJsonValue& id)
{
    QPointer<IpcServer> self(this);
    QPointer<QLocalSocket> guard(socket);
    orchestrator_->discoverDevices([self, guard, id](const airplay::ScanResult& scan) {
        if (!self || !guard) return;
        QJsonArray devices;
        for (const Device& dev : scan.devices)
            devices.append(dev.toJson());
        self->reply(guard, id, devices, scan.ok() ? QJsonObject() : scan.error.toJson());
    });
}

void IpcServer::handleBeginPairing(QLocalSocket* socket, const QJsonValue& id, const QJsonObject& data)
{
    const auto key = orchestrator_->keyFor(data.value("address").toString(),
                                           data.value("port").toInt());
    QPointer<IpcServer> self(this);
    QPointer<QLocalSocket> guard(socket);
    orchestrator_->beginPairing(key, [self, guard, id](const airplay::PairingResult& r) {
        if (!self || !guard) return;
        self->reply(guard, id, r.ok(), r.ok() ? QJsonObject() : r.error.toJson());
    });
}

void IpcServer::handlePairDevice(QLocalSocket* socket, const QJsonValue& id, const QJsonObject& data)
{
    const auto key = orchestrator_->keyFor(data.value("address").toString(),
                                           data.value("port").toInt());
    const QString pin = data.value("pin").toVariant().toString();
    QPointer<IpcServer> self(this);
    QPointer<QLocalSocket> guard(socket);
    orchestrator_->pairDevice(key, pin, [self, guard, id](const airplay::PairingResult& r) {
        if (!self || !guard) return;
        self->reply(guard, id, r.ok(), r.ok() ? QJsonObject() : r.error.toJson());
    });
}

void IpcServer::handleStartStreaming(QLocalSocket* socket, const QJsonValue& id, const QJsonObject& data)
{
    const auto key = orchestrator_->keyFor(data.value("address").toString(),
                                           data.value("port").toInt());
    QPointer<IpcServer> self(this);
    QPointer<QLocalSocket> guard(socket);
    orchestrator_->startStreaming(key, [self, guard, id](const airplay::StreamingResult& r) {
        if (!self || !guard) return;
        self->reply(guard, id, r.ok(), r.ok() ? QJsonObject() : r.error.toJson());
    });
}

void IpcServer::handleStopStreaming(QLocalSocket* socket, const QJsonValue& id)
{
    QPointer<IpcServer> self(this);
    QPointer<QLocalSocket> guard(socket);
    orchestrator_->stopStreaming([self, guard, id](const airplay::StreamingResult& r) {
        if (!self || !guard) return;
        self->reply(guard, id, r.ok(), r.ok() ? QJsonObject() : r.error.toJson());
    });
}

void IpcServer::handleTestConnection(QLocalSocket* socket, const QJsonValue& id, const QJsonObject& data)
{
    const int port = data.value("port").toInt();
    QPointer<IpcServer> self(this);
    QPointer<QLocalSocket> guard(socket);
    orchestrator_->testDeviceConnection(
        data.value("address").toString(), (port > 0 && port <= 65535) ? static_cast<uint16_t>(port) : 0,
        [self, guard, id](bool reachable, const QString& detail) {
            if (!self || !guard) return;
            self->reply(guard, id, reachable,
                        reachable ? QJsonObject()
                                  : ipcError(QStringLiteral("Unreachable"), detail));
        });
}

QJsonObject IpcServer::handleGetConfig() const
{
    QJsonObject config;
    if (!config_) return config;

    for (const QString& key : config_->keys())
        config[key] = QJsonValue::fromVariant(config_->value(key));
    return config;
}

QJsonObject IpcServer::handleSetConfig(const QJsonObject& data)
{
    QJsonObject out;
    if (!config_) {
        out["result"] = false;
        out["error"] = ipcError(QStringLiteral("Unavailable"), QStringLiteral("No config service"));
        return out;
    }

    const QString key = data.value("key").toString();
    if (!config_->setValue(key, data.value("value").toVariant())) {
        out["result"] = false;
        out["error"] = ipcError(QStringLiteral("InvalidKey"),
                                QStringLiteral("Unknown config key: %1").arg(key));
        return out;
    }

    config_->save();
    out["result"] = true;
    return out;
}

void IpcServer::reply(QLocalSocket* socket, const QJsonValue& id, const QJsonValue& result,
                      const QJsonObject& error)
{
    QJsonObject obj;
    obj["id"] = id.isUndefined() ? QJsonValue(QJsonValue::Null) : id;
    obj["result"] = result;
    if (!error.isEmpty())
        obj["error"] = error;
    writeLine(socket, obj);
}

void IpcServer::writeLine(QLocalSocket* socket, const QJsonObject& obj)
{
    if (!socket || socket->state() != QLocalSocket::ConnectedState)
        return;
    socket->write(QJsonDocument(obj).toJson(QJsonDocument::Compact) + "\n");
    socket->flush();
}

QJsonObject IpcServer::ipcError(const QString& kind, const QString& reason)
{
    QJsonObject err;
    err["domain"] = QStringLiteral("ipc");
    err["kind"] = kind;
    err["reason"] = reason;
    return err;
}

} // namespace adk
