#include "PosixLifecycleHook.hpp"
#include "RelayLogging.hpp"
#include <csignal>

PosixLifecycleHook::PosixLifecycleHook(boost::asio::io_context& ioc, LifecycleController& lifecycle)
    : m_signals(ioc)
    , m_lifecycle(lifecycle)
{
}

PosixLifecycleHook::~PosixLifecycleHook() {
    stop();
}

void PosixLifecycleHook::start() {
    if (m_running) return;
    boost::system::error_code ec;
    m_signals.add(SIGTSTP, ec);
    if (!ec) m_signals.add(SIGCONT, ec);
    if (ec) {
        rLog_Error("Cannot install job-control handlers:" << QString::fromStdString(ec.message()));
        return;
    }
    m_running = true;
    rLog_App("Job-control lifecycle hook installed");
    arm();
}

void PosixLifecycleHook::stop() {
    if (!m_running) return;
    m_running = false;
    boost::system::error_code ec;
    m_signals.cancel(ec);
    m_signals.clear(ec);
}

void PosixLifecycleHook::arm() {
    m_signals.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (ec) return;   // cancelled in stop()
        onSignal(signo);
        if (m_running) arm();
    });
}

void PosixLifecycleHook::onSignal(int signo) {
    if (signo == SIGTSTP) {
        rLog_App("SIGTSTP: pausing session before stopping");
        // The default action was replaced by the handler; stop for real once closed
        m_lifecycle.pause([] { ::raise(SIGSTOP); });
    } else if (signo == SIGCONT) {
        rLog_App("SIGCONT: resuming session");
        m_lifecycle.resume();
    }
}
