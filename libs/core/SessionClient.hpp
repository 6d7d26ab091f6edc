#pragma once
/*
Relay — SessionClient
Role: Qt facade that owns the I/O thread, the TLS context, the pub/sub session and its lifecycle controller.
Inputs/Outputs: Takes URL/topics/envelopes from the UI thread; re-emits session events as Qt signals.
Threading: Public methods are called from the owner's thread; the session runs on a private io_context thread.
           Session events are marshalled back with QMetaObject::invokeMethod (QueuedConnection).
Integration: relay_cli and GUI hosts; attachToApplicationState() wires Qt's application state to pause/resume.
Observability: Lifecycle on relay.app; the session and transport log their own detail.
Related: SessionClient.cpp, SessionController.hpp, LifecycleController.hpp, BeastWsTransport.hpp.
*/
#include <QObject>
#include <QString>
#include <QStringList>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/signals2/connection.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <thread>
#include <vector>
#include "pubsub/dispatch/TopicEventRouter.hpp"
#include "pubsub/lifecycle/LifecycleController.hpp"
#include "pubsub/session/SessionConfig.hpp"
#include "pubsub/session/SessionController.hpp"

class QGuiApplication;

class SessionClient : public QObject {
    Q_OBJECT

public:
    explicit SessionClient(SessionConfig config = {}, QObject* parent = nullptr);
    ~SessionClient() override;                 // RAII shutdown

    // Starts the I/O thread; opens config().url and subscribes config().topics when set.
    void start();
    // Graceful close (bounded by closeTimeout), then joins the I/O thread.
    void stop();

    // Rejected URLs and opens aborted by close or pause are reported through errorOccurred().
    void open(const QString& url, bool clearSubscriptions = true);
    void subscribe(const QString& topic);
    void send(const QString& topic, const QString& payload);
    void clearSubscriptions();
    void close();

    void pause();
    void resume();
    // Active -> resume, Suspended/Hidden -> pause. Inactive (focus loss) is ignored.
    void attachToApplicationState(QGuiApplication* app);

    [[nodiscard]] bool isConnected() const { return m_session->isConnected(); }
    [[nodiscard]] bool isRunning() const { return m_running.load(); }
    [[nodiscard]] QString url() const { return QString::fromStdString(m_session->url()); }
    [[nodiscard]] QStringList topics() const;

    [[nodiscard]] SessionController& session() const { return *m_session; }
    [[nodiscard]] TopicEventRouter& router() const { return *m_router; }
    [[nodiscard]] LifecycleController& lifecycle() const { return *m_lifecycle; }
    [[nodiscard]] boost::asio::io_context& ioContext() { return m_ioc; }

    // Non-copyable, non-movable (manages thread)
    SessionClient(const SessionClient&) = delete;
    SessionClient& operator=(const SessionClient&) = delete;
    SessionClient(SessionClient&&) = delete;
    SessionClient& operator=(SessionClient&&) = delete;

signals:
    void messageReceived(const QString& topic, const QString& type, const QString& payload);
    void opened();
    void closed();
    void errorOccurred(const QString& error);
    void connectionStatusChanged(bool connected);

private:
    void bridgeSessionEvents();
    void emitError(QString msg);

    const SessionConfig                 m_config;
    boost::asio::ssl::context           m_sslCtx{boost::asio::ssl::context::tlsv12_client};
    boost::asio::io_context             m_ioc;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> m_workGuard;
    std::thread                         m_ioThread;
    std::atomic<bool>                   m_running{false};

    std::shared_ptr<SessionController>  m_session;
    std::shared_ptr<TopicEventRouter>   m_router;
    std::unique_ptr<LifecycleController> m_lifecycle;
    std::vector<boost::signals2::scoped_connection> m_links;
};
