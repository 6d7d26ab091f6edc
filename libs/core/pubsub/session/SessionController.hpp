#pragma once
/*
Relay — SessionController
Role: Owns the pub/sub session: target URL, active/candidate connections, outbound queue,
      subscription registry and the paused flag. Decides when to (re)connect.
Inputs/Outputs: open/send/subscribe/close from callers; emits opened/closed/messageReceived/error.
Threading: Every state transition runs on one strand of the supplied io_context. Public methods
           post and return; open()/close() hand back futures completed from the strand.
Lifetime: Create through create(); transport callbacks hold weak references, so late events
          after destruction or dispose() are dropped.
Related: WsTransport.hpp, OutboundQueue.hpp, SubscriptionRegistry.hpp, LifecycleController.hpp.
*/
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/signals2/signal.hpp>
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../model/Envelope.hpp"
#include "../ws/WsTransport.hpp"
#include "../dispatch/TopicDispatcher.hpp"
#include "OutboundQueue.hpp"
#include "SessionConfig.hpp"
#include "SubscriptionRegistry.hpp"

enum class SessionState { Disconnected, Connecting, Open };

const char* toString(SessionState state);

class SessionController : public std::enable_shared_from_this<SessionController> {
public:
    using TransportFactory = std::function<std::shared_ptr<WsTransport>()>;
    // nullptr once a connection opened; SessionAbortedError when close/pause/dispose won.
    using OpenCallback = std::function<void(std::exception_ptr)>;

    using MessageSignal = boost::signals2::signal<void(const Envelope&)>;
    using OpenedSignal  = boost::signals2::signal<void()>;
    using ClosedSignal  = boost::signals2::signal<void()>;
    using ErrorSignal   = boost::signals2::signal<void(const std::string&)>;

    static std::shared_ptr<SessionController> create(boost::asio::io_context& ioc,
                                                     TransportFactory factory,
                                                     SessionConfig config = {});
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Starts (or joins) a connection attempt. A different URL or clearSubscriptions
    // drops the registry and the queue first. Throws std::invalid_argument for a
    // URL that is not http(s)/ws(s). The future completes once a connection opened.
    std::future<void> open(std::string url, bool clearSubscriptions = true);
    // Same as above, completing through onComplete on the session strand.
    void open(std::string url, bool clearSubscriptions, OpenCallback onComplete);

    // Transmits immediately when open, otherwise queues and triggers an attempt.
    void send(Envelope envelope);

    void subscribe(std::string topic);

    // Binds a typed handler on the attached dispatcher, then subscribes.
    template <typename T>
    void subscribe(std::string topic, std::function<void(const TopicEvent<T>&)> callback);

    void clearSubscriptions();

    // Graceful close; always emits exactly one closed() signal. The future carries any
    // close failure other than "not connected".
    std::future<void> close();

    // Host lifecycle overlay, driven by LifecycleController.
    void suspend(std::function<void()> onSuspended = {});
    void resume();

    // Aborts every connection without close handshakes and ignores later transport events.
    void dispose();

    void attachEventDispatcher(std::shared_ptr<TopicDispatcher> dispatcher);

    boost::signals2::connection onMessageReceived(const MessageSignal::slot_type& cb) { return m_messageReceived.connect(cb); }
    boost::signals2::connection onOpened(const OpenedSignal::slot_type& cb)           { return m_opened.connect(cb); }
    boost::signals2::connection onClosed(const ClosedSignal::slot_type& cb)           { return m_closed.connect(cb); }
    boost::signals2::connection onError(const ErrorSignal::slot_type& cb)             { return m_error.connect(cb); }

    // Snapshots, safe from any thread
    [[nodiscard]] SessionState state() const { return m_state.load(); }
    [[nodiscard]] bool isConnected() const { return m_state.load() == SessionState::Open; }
    [[nodiscard]] bool isPaused() const { return m_paused.load(); }
    [[nodiscard]] std::string url() const;
    [[nodiscard]] std::vector<std::string> subscribedTopics() const { return m_registry.topics(); }
    [[nodiscard]] std::size_t pendingCount() const { return m_queue.size(); }
    [[nodiscard]] const SessionConfig& config() const { return m_config; }

private:
    SessionController(boost::asio::io_context& ioc, TransportFactory factory, SessionConfig config);

    // One of the two connection slots: the active connection or the in-flight candidate.
    struct ConnectionSlot {
        std::uint64_t id{0};
        std::shared_ptr<WsTransport> transport;
        std::vector<boost::signals2::scoped_connection> links;
    };
    using OpenWaiter = OpenCallback;

    // All of the following run on m_strand
    void doOpen(std::string url, bool clearSubscriptions, OpenWaiter waiter);
    void doSend(Envelope envelope);
    void doSubscribe(std::string topic);
    void doClearSubscriptions();
    void doClose(std::function<void(std::exception_ptr)> done);
    void doSuspend(std::function<void()> onSuspended);
    void doResume();
    void doDispose();

    void socketOpen();
    void completeOpen(std::uint64_t id);
    void handleMessage(std::uint64_t id, const std::string& bytes);
    void handleClose(std::uint64_t id, std::uint16_t code);
    void handleError(std::uint64_t id, const std::string& message);
    void tryReconnect(std::uint16_t code);
    void retire(ConnectionSlot slot);
    void queueSubscriptions();
    void flushQueue();
    void transmit(const Envelope& envelope);
    void releaseWaiters(std::exception_ptr error);
    void updateState();
    [[nodiscard]] bool connected() const;

    template <typename F>
    void post(F&& f) {
        boost::asio::post(m_strand, [weak = weak_from_this(), f = std::forward<F>(f)]() mutable {
            if (auto self = weak.lock()) f(*self);
        });
    }

    boost::asio::strand<boost::asio::io_context::executor_type> m_strand;
    TransportFactory                                   m_factory;
    const SessionConfig                                m_config;

    std::optional<ConnectionSlot>                      m_active;
    std::optional<ConnectionSlot>                      m_candidate;
    std::uint64_t                                      m_nextConnectionId{0};
    bool                                               m_ready{false};
    bool                                               m_disposed{false};
    std::vector<OpenWaiter>                            m_openWaiters;
    boost::asio::steady_timer                          m_reconnectTimer;
    bool                                               m_reconnectArmed{false};

    OutboundQueue                                      m_queue;
    SubscriptionRegistry                               m_registry;
    std::shared_ptr<TopicDispatcher>                   m_dispatcher;
    boost::signals2::scoped_connection                 m_dispatcherLink;

    mutable std::mutex                                 m_urlMx;
    std::string                                        m_url;
    std::atomic<SessionState>                          m_state{SessionState::Disconnected};
    std::atomic<bool>                                  m_paused{false};

    MessageSignal                                      m_messageReceived;
    OpenedSignal                                       m_opened;
    ClosedSignal                                       m_closed;
    ErrorSignal                                        m_error;
};

template <typename T>
void SessionController::subscribe(std::string topic, std::function<void(const TopicEvent<T>&)> callback) {
    post([topic, callback = std::move(callback)](SessionController& self) mutable {
        if (!self.m_dispatcher) {
            self.m_error("typed subscribe for '" + topic + "' without an attached event dispatcher");
        } else {
            self.m_dispatcher->template listenFor<T>(topic, std::move(callback));
        }
        self.doSubscribe(std::move(topic));
    });
}
