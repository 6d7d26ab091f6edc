/*
Relay — SessionController
Role: Connection lifecycle state machine for the pub/sub session.
Inputs/Outputs: Caller operations in; envelopes out to the active WsTransport; lifecycle signals out.
Threading: Everything below that touches session state runs on m_strand. Transport events arrive
           on the transport's own executor and are re-posted here keyed by connection id, so
           events of retired or discarded connections are recognised and dropped.
Observability: Lifecycle on relay.app, per-frame traffic on relay.data (throttled).
Related: SessionController.hpp, WsTransport.hpp, EnvelopeCodec.hpp.
*/
#include "SessionController.hpp"
#include "../codec/EnvelopeCodec.hpp"
#include "../ws/TransportErrors.hpp"
#include "../ws/WsUrl.hpp"
#include "RelayLogging.hpp"
#include <boost/asio/post.hpp>
#include <stdexcept>
#include <string_view>

namespace {

// Listener exceptions must never unwind into the io_context
template <typename Signal, typename... Args>
void notify(Signal& signal, const char* name, const Args&... args) {
    try {
        signal(args...);
    } catch (const std::exception& e) {
        rLog_Error("Listener for" << name << "threw:" << e.what());
    }
}

// "Not connected" on close is the benign case; everything else goes back to the caller
std::exception_ptr filterCloseError(std::exception_ptr err) {
    if (!err) return nullptr;
    try {
        std::rethrow_exception(err);
    } catch (const AlreadyClosedError& e) {
        if (std::string_view(e.what()).find("not connected") != std::string_view::npos) {
            rLog_Warning("Tried to close a websocket when it's already closed");
            return nullptr;
        }
        return err;
    } catch (const std::exception&) {
        return err;
    }
}

QString q(const std::string& s) { return QString::fromStdString(s); }

} // namespace

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Disconnected: return "Disconnected";
        case SessionState::Connecting:   return "Connecting";
        case SessionState::Open:         return "Open";
    }
    return "Unknown";
}

std::shared_ptr<SessionController> SessionController::create(boost::asio::io_context& ioc,
                                                             TransportFactory factory,
                                                             SessionConfig config) {
    if (!factory) {
        throw std::invalid_argument("SessionController: transport factory is required");
    }
    return std::shared_ptr<SessionController>(new SessionController(ioc, std::move(factory), std::move(config)));
}

SessionController::SessionController(boost::asio::io_context& ioc, TransportFactory factory, SessionConfig config)
    : m_strand(boost::asio::make_strand(ioc))
    , m_factory(std::move(factory))
    , m_config(std::move(config))
    , m_reconnectTimer(m_strand)
{
}

SessionController::~SessionController() {
    for (auto* slot : {&m_active, &m_candidate}) {
        if (*slot && (*slot)->transport) {
            (*slot)->links.clear();
            (*slot)->transport->cancel();
        }
    }
}

std::string SessionController::url() const {
    std::lock_guard lock(m_urlMx);
    return m_url;
}

// =============================================================================
// Public API: post onto the strand
// =============================================================================

std::future<void> SessionController::open(std::string url, bool clearSubscriptions) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    open(std::move(url), clearSubscriptions, [promise](std::exception_ptr err) {
        if (err) promise->set_exception(err);
        else promise->set_value();
    });
    return future;
}

void SessionController::open(std::string url, bool clearSubscriptions, OpenCallback onComplete) {
    if (!ws_url::parse(ws_url::normalizeScheme(url))) {
        throw std::invalid_argument("SessionController::open: unsupported URL '" + url + "'");
    }
    post([url = std::move(url), clearSubscriptions, onComplete = std::move(onComplete)](SessionController& self) mutable {
        self.doOpen(std::move(url), clearSubscriptions, std::move(onComplete));
    });
}

void SessionController::send(Envelope envelope) {
    post([envelope = std::move(envelope)](SessionController& self) mutable {
        self.doSend(std::move(envelope));
    });
}

void SessionController::subscribe(std::string topic) {
    post([topic = std::move(topic)](SessionController& self) mutable {
        self.doSubscribe(std::move(topic));
    });
}

void SessionController::clearSubscriptions() {
    post([](SessionController& self) { self.doClearSubscriptions(); });
}

std::future<void> SessionController::close() {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    post([promise](SessionController& self) {
        self.doClose([promise](std::exception_ptr err) {
            if (err) promise->set_exception(err);
            else promise->set_value();
        });
    });
    return future;
}

void SessionController::suspend(std::function<void()> onSuspended) {
    post([onSuspended = std::move(onSuspended)](SessionController& self) mutable {
        self.doSuspend(std::move(onSuspended));
    });
}

void SessionController::resume() {
    post([](SessionController& self) { self.doResume(); });
}

void SessionController::dispose() {
    post([](SessionController& self) { self.doDispose(); });
}

void SessionController::attachEventDispatcher(std::shared_ptr<TopicDispatcher> dispatcher) {
    post([dispatcher = std::move(dispatcher)](SessionController& self) mutable {
        self.m_dispatcherLink.disconnect();
        self.m_dispatcher = std::move(dispatcher);
        if (self.m_dispatcher) {
            self.m_dispatcherLink = self.m_messageReceived.connect(
                [d = self.m_dispatcher](const Envelope& e) { d->dispatch(e); });
        }
    });
}

// =============================================================================
// Strand-side operations
// =============================================================================

void SessionController::doOpen(std::string url, bool clearSubscriptions, OpenWaiter waiter) {
    if (m_disposed) {
        if (waiter) waiter(std::make_exception_ptr(SessionAbortedError("session has been disposed")));
        return;
    }
    if (url != this->url() || clearSubscriptions) {
        doClearSubscriptions();
    }
    {
        std::lock_guard lock(m_urlMx);
        m_url = std::move(url);
    }
    if (waiter) m_openWaiters.push_back(std::move(waiter));
    socketOpen();
}

void SessionController::doSend(Envelope envelope) {
    if (m_disposed) {
        rLog_Warning("Dropping envelope for" << q(envelope.topic) << "- session disposed");
        return;
    }
    if (!connected()) {
        m_queue.push(std::move(envelope));
        if (m_paused) {
            rLog_Data("Session paused; envelope queued until resume (" << m_queue.size() << "pending)");
            return;
        }
        socketOpen();
        return;
    }
    transmit(envelope);
}

void SessionController::doSubscribe(std::string topic) {
    rLog_App("Subscribe to" << q(topic));
    doSend(Envelope::subscribe(topic));
    m_registry.add(topic);
}

void SessionController::doClearSubscriptions() {
    auto removed = m_registry.clear();
    if (m_dispatcher) {
        for (const auto& topic : removed) {
            m_dispatcher->unsubscribeTopic(topic);
        }
    }
    const auto dropped = m_queue.size();
    m_queue.clear();
    if (!removed.empty() || dropped > 0) {
        rLog_App("Cleared" << removed.size() << "subscriptions and" << dropped << "queued envelopes");
    }
}

void SessionController::doClose(std::function<void(std::exception_ptr)> done) {
    rLog_App("Closing WebSocket");

    // A pending backoff must not resurrect the session after an explicit close
    m_reconnectArmed = false;
    m_reconnectTimer.cancel();

    if (m_candidate) {
        auto slot = std::move(*m_candidate);
        m_candidate.reset();
        slot.links.clear();
        slot.transport->cancel();
    }
    if (!m_openWaiters.empty()) {
        releaseWaiters(std::make_exception_ptr(SessionAbortedError("session closed before the connection opened")));
    }

    m_ready = false;
    if (!m_active) {
        updateState();
        notify(m_closed, "closed");
        if (done) done(nullptr);
        return;
    }

    auto slot = std::move(*m_active);
    m_active.reset();
    updateState();
    // Detach before closing so the close event cannot trigger a reconnect
    slot.links.clear();

    auto transport = slot.transport;
    auto finished = std::make_shared<bool>(false);
    auto timer = std::make_shared<boost::asio::steady_timer>(m_strand, m_config.closeTimeout);
    auto finish = [weak = weak_from_this(), done, finished, timer](std::exception_ptr err) {
        if (*finished) return;
        *finished = true;
        timer->cancel();
        err = filterCloseError(err);
        if (auto self = weak.lock()) {
            notify(self->m_closed, "closed");
        }
        if (done) done(err);
    };

    timer->async_wait([finish, transport](const boost::system::error_code& ec) {
        if (ec) return;
        rLog_Warning("Close handshake timed out; dropping the connection");
        transport->cancel();
        finish(nullptr);
    });
    transport->close([strand = m_strand, finish](std::exception_ptr err) {
        boost::asio::post(strand, [finish, err]() { finish(err); });
    });
}

void SessionController::doSuspend(std::function<void()> onSuspended) {
    rLog_App("Pausing");
    m_paused = true;
    doClose([onSuspended = std::move(onSuspended)](std::exception_ptr err) {
        if (err) {
            try {
                std::rethrow_exception(err);
            } catch (const std::exception& e) {
                rLog_Warning("Close while pausing failed:" << e.what());
            }
        }
        if (onSuspended) onSuspended();
    });
}

void SessionController::doResume() {
    if (!m_paused) {
        rLog_Debug("Resume requested while not paused");
        return;
    }
    m_paused = false;
    const std::string target = url();
    if (target.empty()) {
        rLog_App("Resumed before any URL was opened");
        return;
    }

    rLog_App("Resuming");
    doOpen(target, false, [weak = weak_from_this()](std::exception_ptr err) {
        if (err) return;
        auto self = weak.lock();
        if (!self) return;
        for (const auto& topic : self->m_registry.topics()) {
            self->doSubscribe(topic);
        }
    });
}

void SessionController::doDispose() {
    if (m_disposed) return;
    rLog_App("Disposing session for" << q(url()));
    m_disposed = true;
    m_reconnectArmed = false;
    m_reconnectTimer.cancel();
    for (auto* slot : {&m_active, &m_candidate}) {
        if (*slot) {
            (*slot)->links.clear();
            (*slot)->transport->cancel();
            slot->reset();
        }
    }
    m_ready = false;
    updateState();
    releaseWaiters(std::make_exception_ptr(SessionAbortedError("session has been disposed")));
}

// =============================================================================
// Attempt sequence
// =============================================================================

void SessionController::socketOpen() {
    if (m_disposed) return;
    if (m_candidate) {
        const auto st = m_candidate->transport->state();
        if (st == ConnectionState::Closed) {
            rLog_Error("Socket was closed but not cleared; discarding connection" << m_candidate->id);
            m_candidate->links.clear();
            m_candidate.reset();
        } else {
            rLog_App("Will not try to open socket because it is already in state:" << toString(st));
            return;
        }
    }

    const std::string target = ws_url::normalizeScheme(url());
    if (target.empty()) {
        rLog_Warning("No target URL yet; call open() first");
        return;
    }

    // An attempt starting now supersedes any pending backoff
    m_reconnectArmed = false;
    m_reconnectTimer.cancel();

    ConnectionSlot slot;
    slot.id = ++m_nextConnectionId;
    slot.transport = m_factory();
    if (!slot.transport) {
        rLog_Error("Transport factory returned no transport");
        notify(m_error, "error", std::string("transport factory returned no transport"));
        return;
    }

    const auto id = slot.id;
    auto weak = weak_from_this();
    auto& t = *slot.transport;
    slot.links.emplace_back(t.onOpen([weak, id]() {
        if (auto self = weak.lock()) self->post([id](SessionController& s) { s.completeOpen(id); });
    }));
    slot.links.emplace_back(t.onMessage([weak, id](const std::string& bytes) {
        if (auto self = weak.lock()) self->post([id, bytes](SessionController& s) { s.handleMessage(id, bytes); });
    }));
    slot.links.emplace_back(t.onClose([weak, id](std::uint16_t code) {
        if (auto self = weak.lock()) self->post([id, code](SessionController& s) { s.handleClose(id, code); });
    }));
    slot.links.emplace_back(t.onError([weak, id](const std::string& message) {
        if (auto self = weak.lock()) self->post([id, message](SessionController& s) { s.handleError(id, message); });
    }));

    m_candidate = std::move(slot);
    updateState();

    rLog_App("Trying to open socket" << id << "to" << q(target));
    m_candidate->transport->connect(target);
}

void SessionController::completeOpen(std::uint64_t id) {
    if (!m_candidate || m_candidate->id != id) {
        rLog_Debug("Ignoring open of stale connection" << id);
        return;
    }

    // Never two active connections: the previous one goes before the candidate is promoted
    if (m_active) {
        auto previous = std::move(*m_active);
        m_active.reset();
        retire(std::move(previous));
    }
    m_active = std::move(m_candidate);
    m_candidate.reset();

    queueSubscriptions();
    m_ready = true;
    updateState();
    rLog_App("Opened" << q(url()) << "(connection" << id << ")");

    notify(m_opened, "opened");
    flushQueue();
    releaseWaiters(nullptr);
}

void SessionController::retire(ConnectionSlot slot) {
    slot.links.clear();
    m_ready = false;
    const auto id = slot.id;
    slot.transport->close([id](std::exception_ptr err) {
        if (!filterCloseError(err)) return;
        try {
            std::rethrow_exception(err);
        } catch (const std::exception& e) {
            rLog_Warning("Closing retired connection" << id << "failed:" << e.what());
        }
    });
    notify(m_closed, "closed");
}

void SessionController::queueSubscriptions() {
    std::size_t queued = 0;
    for (auto& envelope : m_registry.buildReplay()) {
        // A subscribe issued while disconnected is already waiting in the queue
        if (m_queue.hasSubscribeFor(envelope.topic)) continue;
        m_queue.push(std::move(envelope));
        ++queued;
    }
    rLog_App("Queued" << queued << "subscriptions");
}

void SessionController::flushQueue() {
    auto pending = m_queue.drain();
    rLog_App("Flushing Queue. Count:" << pending.size());
    for (const auto& envelope : pending) {
        transmit(envelope);
    }
}

void SessionController::transmit(const Envelope& envelope) {
    rLog_Data("Sending" << q(envelope.type) << "on" << q(envelope.topic));
    m_active->transport->send(EnvelopeCodec::encode(envelope));
}

// =============================================================================
// Transport events
// =============================================================================

void SessionController::handleMessage(std::uint64_t id, const std::string& bytes) {
    if (!m_active || m_active->id != id) return;

    Envelope envelope;
    try {
        envelope = EnvelopeCodec::decode(bytes);
    } catch (const DecodeError& e) {
        rLog_Warning("Dropping undecodable frame:" << e.what());
        return;
    }

    rLog_Data("Received" << q(envelope.type) << "on" << q(envelope.topic));
    doSend(Envelope::ack(envelope.topic));
    notify(m_messageReceived, "messageReceived", envelope);
}

void SessionController::handleClose(std::uint64_t id, std::uint16_t code) {
    const bool isActive = m_active && m_active->id == id;
    const bool isCandidate = m_candidate && m_candidate->id == id;
    if (!isActive && !isCandidate) return;

    if (isActive) {
        m_active.reset();
        m_ready = false;
        updateState();
        rLog_Warning("Connection" << id << "closed with code" << code);
        notify(m_closed, "closed");
        // A newer attempt is already under way; let it finish
        if (m_candidate && m_candidate->transport->state() != ConnectionState::Closed) return;
    } else {
        rLog_Warning("Connection attempt" << id << "closed with code" << code);
    }
    tryReconnect(code);
}

void SessionController::handleError(std::uint64_t id, const std::string& message) {
    const bool known = (m_active && m_active->id == id) || (m_candidate && m_candidate->id == id);
    if (!known) return;
    rLog_Warning("Transport error on connection" << id << ":" << q(message));
    notify(m_error, "error", message);
}

void SessionController::tryReconnect(std::uint16_t code) {
    if (m_candidate) {
        m_candidate->links.clear();
        m_candidate.reset();
    }
    updateState();

    if (m_paused) {
        rLog_App("Application paused, retry attempt aborted");
        return;
    }
    if (m_disposed) return;

    if (!close_code::isAbnormal(code)) {
        socketOpen();
        return;
    }

    rLog_Warning("Abnormal close detected. Waiting for" << m_config.reconnectDelay.count() << "ms before reconnect");
    m_reconnectArmed = true;
    m_reconnectTimer.expires_after(m_config.reconnectDelay);
    m_reconnectTimer.async_wait([weak = weak_from_this()](const boost::system::error_code& ec) {
        if (ec) return;
        auto self = weak.lock();
        if (!self || !self->m_reconnectArmed) return;
        self->m_reconnectArmed = false;
        if (self->m_paused) {
            rLog_App("Application paused, retry attempt aborted");
            return;
        }
        self->socketOpen();
    });
}

// =============================================================================
// Helpers
// =============================================================================

void SessionController::releaseWaiters(std::exception_ptr error) {
    std::vector<OpenWaiter> waiters;
    waiters.swap(m_openWaiters);
    for (auto& waiter : waiters) {
        try {
            waiter(error);
        } catch (const std::exception& e) {
            rLog_Error("Open waiter threw:" << e.what());
        }
    }
}

void SessionController::updateState() {
    if (connected()) {
        m_state = SessionState::Open;
    } else if (m_candidate) {
        m_state = SessionState::Connecting;
    } else {
        m_state = SessionState::Disconnected;
    }
}

bool SessionController::connected() const {
    return m_ready && m_active && m_active->transport->state() == ConnectionState::Open;
}
