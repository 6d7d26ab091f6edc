#include "SessionClient.hpp"
#include "RelayLogging.hpp"
#include "pubsub/lifecycle/PosixLifecycleHook.hpp"
#include "pubsub/session/SessionConfig.hpp"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QMetaObject>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>
#include <utility>

namespace {

// "topic=payload" -> {topic, payload}; payload may itself contain '='
std::pair<QString, QString> splitSend(const QString& arg) {
    const auto eq = arg.indexOf('=');
    if (eq <= 0) return {};
    return {arg.left(eq), arg.mid(eq + 1)};
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("relay_cli");

    QCommandLineParser parser;
    parser.setApplicationDescription("Topic-based pub/sub client over a persistent WebSocket");
    parser.addHelpOption();
    QCommandLineOption configOpt("config", "JSON session configuration file.", "path");
    QCommandLineOption urlOpt("url", "Endpoint (http, https, ws or wss).", "url");
    QCommandLineOption topicOpt("topic", "Topic to subscribe to (repeatable).", "topic");
    QCommandLineOption sendOpt("send", "Envelope to publish once (repeatable).", "topic=payload");
    parser.addOptions({configOpt, urlOpt, topicOpt, sendOpt});
    parser.process(app);

    SessionConfig config;
    try {
        if (parser.isSet(configOpt)) {
            config = SessionConfig::fromFile(parser.value(configOpt).toStdString());
        }
        config.applyEnvironment();
    } catch (const std::exception& e) {
        std::cerr << "relay_cli: " << e.what() << std::endl;
        return 2;
    }
    if (parser.isSet(urlOpt)) {
        config.url = parser.value(urlOpt).toStdString();
    }
    for (const auto& topic : parser.values(topicOpt)) {
        config.topics.push_back(topic.toStdString());
    }
    if (config.url.empty()) {
        std::cerr << "relay_cli: no endpoint; pass --url, --config or set RELAY_URL" << std::endl;
        return 2;
    }

    SessionClient client(config);

    QObject::connect(&client, &SessionClient::messageReceived, &app,
                     [](const QString& topic, const QString& type, const QString& payload) {
        std::cout << topic.toStdString() << " [" << type.toStdString() << "] "
                  << payload.toStdString() << std::endl;
    });
    QObject::connect(&client, &SessionClient::connectionStatusChanged, &app, [](bool connected) {
        std::cout << (connected ? "[connected]" : "[disconnected]") << std::endl;
    });
    QObject::connect(&client, &SessionClient::errorOccurred, &app, [](const QString& error) {
        std::cerr << "[error] " << error.toStdString() << std::endl;
    });

    PosixLifecycleHook jobControl(client.ioContext(), client.lifecycle());

    boost::asio::signal_set terminate(client.ioContext(), SIGINT, SIGTERM);
    terminate.async_wait([](const boost::system::error_code& ec, int) {
        if (ec) return;
        QMetaObject::invokeMethod(qApp, [] { QCoreApplication::quit(); }, Qt::QueuedConnection);
    });

    client.start();
    jobControl.start();

    for (const auto& arg : parser.values(sendOpt)) {
        const auto [topic, payload] = splitSend(arg);
        if (topic.isEmpty()) {
            rLog_Warning("Ignoring malformed --send" << arg << "(expected topic=payload)");
            continue;
        }
        client.send(topic, payload);
    }

    const int rc = app.exec();

    client.stop();
    jobControl.stop();
    boost::system::error_code ignored;
    terminate.cancel(ignored);
    return rc;
}
