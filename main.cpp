#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileSystemWatcher>
#include <QObject>
#include <QPointF>
#include <QTimer>

#include "lifecycle/stop_signal.h"
#include "config/config.h"
#include "mqtt_connector/mqtt_client.h"
#include "navigator/beacon_registry.h"
#include "navigator/navigator.h"

#include <algorithm>
#include <iostream>
#include <memory>

namespace {

void printStats(const navigator::Navigator& nav, std::size_t trackers) {
    auto s = nav.stats();
    std::cout << "trackers=" << trackers << " received=" << s.reportsReceived
              << " processed=" << s.reportsProcessed << " fixes=" << s.fixes
              << " unknown_beacons=" << s.unknownBeacons
              << " insufficient=" << s.insufficientData << " out_of_order=" << s.outOfOrder
              << " degenerate=" << s.degenerateGeometry << " overflows=" << s.queueOverflows
              << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("beacon_tracker");

    QCommandLineParser parser;
    parser.setApplicationDescription("BLE beacon position tracker");
    parser.addHelpOption();
    QCommandLineOption siteOption({"s", "site"}, "Beacon layout JSON.", "file", "site_config.json");
    QCommandLineOption runtimeOption({"r", "runtime"}, "Runtime JSON (mqtt, kalman, tracker).", "file",
                                     "server_runtime_config.json");
    QCommandLineOption statsOption("stats-interval", "Seconds between status lines.", "seconds", "10");
    parser.addOption(siteOption);
    parser.addOption(runtimeOption);
    parser.addOption(statsOption);
    parser.process(app);

    const std::string sitePath = parser.value(siteOption).toStdString();
    const std::string runtimePath = parser.value(runtimeOption).toStdString();

    config::SiteConfig site;
    config::RuntimeConfig runtime;
    try {
        site = config::ConfigReader(sitePath).readSite();
        runtime = config::ConfigReader(runtimePath).readRuntime();
    } catch (const config::InvalidConfiguration& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 2;
    }

    auto registry = std::make_shared<navigator::BeaconRegistry>(site);
    navigator::Navigator nav(registry, navigator::NavigatorSettings::fromRuntime(runtime));
    nav.setErrorHandler([](const navigator::ErrorEvent& event) {
        std::cerr << "[" << navigator::toString(event.kind) << "] " << event.trackerId << ": "
                  << event.detail << std::endl;
    });

    std::cout << "Loaded " << registry->size() << " beacons, n=" << registry->propagationFactor()
              << std::endl;

    mqtt_connector::MqttClient client(&nav);

    QObject::connect(&client, &mqtt_connector::MqttClient::trackerUpdated, &app,
                     [](const QString& trackerId, const QPointF& pos) {
                         std::cout << trackerId.toStdString() << " -> (" << pos.x() << ", "
                                   << pos.y() << ")" << std::endl;
                     });
    QObject::connect(&client, &mqtt_connector::MqttClient::setConnectStatus, &app,
                     [](const QString& status) {
                         std::cout << "MQTT: " << status.toStdString() << std::endl;
                     });

    if (runtime.mqtt.enabled) {
        const std::string topic = config::expandTopicPattern(runtime.mqtt);
        if (!client.initialize(mqtt_connector::MqttClient::connectionConfigFrom(runtime.mqtt), topic,
                               runtime.mqtt.publishTopic)) {
            std::cerr << client.getStatus();
            return 1;
        }
        client.setAutoReconnect(true);
        std::cout << "Subscribed to " << topic << std::endl;
    } else {
        std::cout << "MQTT ingestion disabled in " << runtimePath << std::endl;
    }

    // Перезагрузка маяков при изменении файла площадки
    QFileSystemWatcher watcher;
    watcher.addPath(QString::fromStdString(sitePath));
    QObject::connect(&watcher, &QFileSystemWatcher::fileChanged, &app,
                     [&nav, &watcher, sitePath](const QString& path) {
                         try {
                             nav.reloadBeacons(config::ConfigReader(sitePath).readSite());
                             std::cout << "Reloaded " << nav.registry().size() << " beacons"
                                       << std::endl;
                         } catch (const config::InvalidConfiguration& e) {
                             std::cerr << "Keeping previous beacons, reload failed: " << e.what()
                                       << std::endl;
                         }
                         // редакторы заменяют файл целиком
                         if (!watcher.files().contains(path)) {
                             watcher.addPath(path);
                         }
                     });

    QTimer statsTimer;
    QObject::connect(&statsTimer, &QTimer::timeout, &app,
                     [&nav]() { printStats(nav, nav.snapshot().size()); });
    statsTimer.start(std::max(1, parser.value(statsOption).toInt()) * 1000);

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&client, &nav]() {
        client.shutdown();
        nav.shutdown();
        printStats(nav, nav.snapshot().size());
    });

    // quit() не async-signal-safe: обработчик ставит флаг, таймер его забирает
    lifecycle::installStopSignals();
    QTimer stopTimer;
    QObject::connect(&stopTimer, &QTimer::timeout, &app, []() {
        if (lifecycle::stopRequested()) {
            QCoreApplication::quit();
        }
    });
    stopTimer.start(200);

    return QCoreApplication::exec();
}
