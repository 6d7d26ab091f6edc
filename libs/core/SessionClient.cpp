/*
Relay — SessionClient
Role: Implements the Qt facade around SessionController.
Threading: A work guard keeps the I/O thread's run() alive until stop() releases it.
Related: SessionClient.hpp.
*/
#include "SessionClient.hpp"
#include "RelayLogging.hpp"
#include "pubsub/ws/BeastWsTransport.hpp"
#include <QGuiApplication>
#include <QMetaObject>
#include <QPointer>
#include <chrono>
#include <exception>
#include <future>

SessionClient::SessionClient(SessionConfig config, QObject* parent)
    : QObject(parent)
    , m_config(std::move(config))
{
    m_sslCtx.set_default_verify_paths();
    m_sslCtx.set_verify_mode(m_config.verifyPeer ? boost::asio::ssl::verify_peer
                                                 : boost::asio::ssl::verify_none);

    BeastWsTransport::Options opts;
    opts.connectTimeout = m_config.connectTimeout;
    opts.pingInterval   = m_config.pingInterval;
    opts.verifyPeer     = m_config.verifyPeer;

    m_session = SessionController::create(m_ioc, BeastWsTransport::factory(m_ioc, m_sslCtx, opts), m_config);
    m_router = std::make_shared<TopicEventRouter>();
    m_session->attachEventDispatcher(m_router);
    m_lifecycle = std::make_unique<LifecycleController>(m_session);

    bridgeSessionEvents();
    rLog_App("SessionClient initialized");
}

SessionClient::~SessionClient() {
    stop();
    m_links.clear();
    rLog_App("SessionClient destroyed");
}

void SessionClient::start() {
    if (m_running.exchange(true)) return;
    rLog_App("Starting SessionClient...");

    m_workGuard.emplace(m_ioc.get_executor());
    m_ioc.restart();
    m_ioThread = std::thread([this] {
        m_ioc.run();
        rLog_Data("IO context stopped");
    });

    if (!m_config.url.empty()) {
        open(QString::fromStdString(m_config.url), false);
        for (const auto& topic : m_config.topics) {
            m_session->subscribe(topic);
        }
    }
}

void SessionClient::stop() {
    if (!m_running.exchange(false)) return;
    rLog_App("Stopping SessionClient...");

    auto closing = m_session->close();
    const auto budget = m_config.closeTimeout + std::chrono::seconds(1);
    if (closing.wait_for(budget) != std::future_status::ready) {
        rLog_Warning("Close did not finish within" << budget.count() << "ms");
    } else {
        try {
            closing.get();
        } catch (const std::exception& e) {
            rLog_Warning("Close failed:" << e.what());
        }
    }

    m_workGuard.reset();
    m_ioc.stop();
    if (m_ioThread.joinable()) {
        m_ioThread.join();
    }
    rLog_App("SessionClient stopped");
}

void SessionClient::open(const QString& url, bool clearSubscriptions) {
    try {
        // Success is reported through opened(); an open aborted by close or pause through errorOccurred()
        m_session->open(url.toStdString(), clearSubscriptions, [this](std::exception_ptr err) {
            if (!err) return;
            try {
                std::rethrow_exception(err);
            } catch (const std::exception& e) {
                rLog_Warning("Open aborted:" << e.what());
                emitError(QString::fromUtf8(e.what()));
            }
        });
    } catch (const std::invalid_argument& e) {
        rLog_Warning("Rejected URL" << url << ":" << e.what());
        emitError(QString::fromUtf8(e.what()));
    }
}

void SessionClient::subscribe(const QString& topic) {
    m_session->subscribe(topic.toStdString());
}

void SessionClient::send(const QString& topic, const QString& payload) {
    m_session->send(Envelope::data(topic.toStdString(), payload.toStdString()));
}

void SessionClient::clearSubscriptions() {
    m_session->clearSubscriptions();
}

void SessionClient::close() {
    (void)m_session->close();
}

void SessionClient::pause() {
    m_lifecycle->pause();
}

void SessionClient::resume() {
    m_lifecycle->resume();
}

void SessionClient::attachToApplicationState(QGuiApplication* app) {
    if (!app) return;
    connect(app, &QGuiApplication::applicationStateChanged, this, [this](Qt::ApplicationState state) {
        switch (state) {
            case Qt::ApplicationActive:
                m_lifecycle->hostStateChanged(true);
                break;
            case Qt::ApplicationSuspended:
            case Qt::ApplicationHidden:
                m_lifecycle->hostStateChanged(false);
                break;
            case Qt::ApplicationInactive:
                break;
        }
    });
}

QStringList SessionClient::topics() const {
    QStringList out;
    for (const auto& topic : m_session->subscribedTopics()) {
        out << QString::fromStdString(topic);
    }
    return out;
}

void SessionClient::emitError(QString msg) {
    QPointer<SessionClient> self(this);
    QMetaObject::invokeMethod(this, [self, m = std::move(msg)] {
        if (!self) return;
        emit self->errorOccurred(m);
    }, Qt::QueuedConnection);
}

void SessionClient::bridgeSessionEvents() {
    // Session signals fire on the I/O thread; hop to ours before emitting
    m_links.emplace_back(m_session->onMessageReceived([this](const Envelope& e) {
        QPointer<SessionClient> self(this);
        QMetaObject::invokeMethod(this, [self,
                                         topic = QString::fromStdString(e.topic),
                                         type = QString::fromStdString(e.type),
                                         payload = QString::fromStdString(e.payload)] {
            if (!self) return;
            emit self->messageReceived(topic, type, payload);
        }, Qt::QueuedConnection);
    }));
    m_links.emplace_back(m_session->onOpened([this] {
        QPointer<SessionClient> self(this);
        QMetaObject::invokeMethod(this, [self] {
            if (!self) return;
            emit self->opened();
            emit self->connectionStatusChanged(true);
        }, Qt::QueuedConnection);
    }));
    m_links.emplace_back(m_session->onClosed([this] {
        QPointer<SessionClient> self(this);
        QMetaObject::invokeMethod(this, [self] {
            if (!self) return;
            emit self->closed();
            emit self->connectionStatusChanged(false);
        }, Qt::QueuedConnection);
    }));
    m_links.emplace_back(m_session->onError([this](const std::string& message) {
        emitError(QString::fromStdString(message));
    }));
}
