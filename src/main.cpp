#include <signal.h>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QLoggingCategory>
#include <memory>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <yaml-cpp/yaml.h>
#include "core/YamlConfig.hpp"
#include "core/airplay/AvahiServiceBrowser.hpp"
#include "core/airplay/HttpPairingTransport.hpp"
#include "core/airplay/MirroringOrchestrator.hpp"
#include "core/airplay/MirroringSettings.hpp"
#include "core/airplay/ProcessCapturePipeline.hpp"
#include "core/services/ConfigService.hpp"
#include "core/services/IpcServer.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("airdecky-core");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("AirDecky");

    QCommandLineParser parser;
    parser.setApplicationDescription("AirPlay screen mirroring backend for the AirDecky panel");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption({"c", "config"}, "YAML config file.", "path",
                                    QDir::homePath() + "/.config/airdecky/config.yaml");
    QCommandLineOption socketOption({"s", "socket"}, "IPC socket path (overrides config).", "path");
    QCommandLineOption verboseOption({"v", "verbose"}, "Enable debug logging.");
    parser.addOption(configOption);
    parser.addOption(socketOption);
    parser.addOption(verboseOption);
    parser.process(app);

    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss.zzz} [%{type}] %{message}");
    const bool verbose = parser.isSet(verboseOption);
    if (!verbose)
        QLoggingCategory::setFilterRules("*.debug=false");
    boost::log::core::get()->set_filter(
        boost::log::trivial::severity >= (verbose ? boost::log::trivial::debug
                                                  : boost::log::trivial::info));

    // Load config if present; otherwise use built-in defaults
    const QString yamlPath = parser.value(configOption);
    auto yamlConfig = std::make_shared<adk::YamlConfig>();
    if (QFile::exists(yamlPath)) {
        try {
            yamlConfig->load(yamlPath);
            qInfo() << "[Main] Loaded config" << yamlPath;
        } catch (const YAML::Exception& e) {
            qWarning() << "[Main] Config" << yamlPath << "is invalid, using defaults:" << e.what();
            yamlConfig = std::make_shared<adk::YamlConfig>();
        }
    }
    if (parser.isSet(socketOption))
        yamlConfig->setSocketPath(parser.value(socketOption));

    auto configService = new adk::ConfigService(yamlConfig.get(), yamlPath, &app);

    const auto settings = adk::airplay::MirroringSettings::fromConfig(*yamlConfig);

    // --- Network collaborators ---
    auto browser = new adk::airplay::AvahiServiceBrowser(&app);
    auto transport = new adk::airplay::HttpPairingTransport(settings.pairingRequestTimeoutMs, &app);
    adk::airplay::ProcessCapturePipelineFactory pipelines(settings.pipeline);

    auto orchestrator = new adk::airplay::MirroringOrchestrator(settings, browser, transport,
                                                                &pipelines, &app);

    const QJsonObject info = orchestrator->systemInfo();
    qInfo() << "[Main] Host:" << info.value("product").toString()
            << info.value("kernel").toString() << info.value("architecture").toString();
    if (!info.value("screen_capture_available").toBool())
        qWarning() << "[Main] Screen capture is not available; start_streaming will fail";

    // --- IPC server for the panel ---
    auto ipcServer = new adk::IpcServer(&app);
    ipcServer->setOrchestrator(orchestrator);
    ipcServer->setConfigService(configService);
    if (!ipcServer->start(yamlConfig->socketPath())) {
        qCritical() << "[Main] Cannot open IPC socket, exiting";
        return 1;
    }

    // An active stream must not outlive the service
    QObject::connect(&app, &QCoreApplication::aboutToQuit, orchestrator, [orchestrator, ipcServer]() {
        orchestrator->shutdown();
        ipcServer->stop();
    });

    // SIGINT/SIGTERM: leave the event loop; aboutToQuit does the teardown
    static QCoreApplication* g_app = &app;
    auto quitHandler = [](int) {
        QMetaObject::invokeMethod(g_app, []() { g_app->quit(); }, Qt::QueuedConnection);
    };
    signal(SIGINT, quitHandler);
    signal(SIGTERM, quitHandler);

    return app.exec();
}
