#include "LifecycleController.hpp"
#include "RelayLogging.hpp"
#include <stdexcept>

LifecycleController::LifecycleController(std::shared_ptr<SessionController> session)
    : m_session(session)
{
    if (!session) {
        throw std::invalid_argument("LifecycleController: session is required");
    }
}

void LifecycleController::pause(std::function<void()> onPaused) {
    auto session = m_session.lock();
    if (!session) {
        rLog_Warning("Pause requested after the session was destroyed");
        if (onPaused) onPaused();
        return;
    }
    if (m_paused.exchange(true)) {
        rLog_Debug("Pause requested while already paused");
    }
    session->suspend(std::move(onPaused));
}

void LifecycleController::resume() {
    auto session = m_session.lock();
    if (!session) {
        rLog_Warning("Resume requested after the session was destroyed");
        return;
    }
    m_paused = false;
    session->resume();
}

void LifecycleController::hostStateChanged(bool foreground) {
    rLog_App("Host moved to" << (foreground ? "foreground" : "background"));
    if (foreground) {
        resume();
    } else {
        pause();
    }
}
