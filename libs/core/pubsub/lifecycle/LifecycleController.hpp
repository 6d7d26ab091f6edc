#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include "../session/SessionController.hpp"

// Maps host lifecycle (foreground/background, job control) onto a session.
// Pause closes the active connection and blocks automatic reconnects; resume
// reopens the last URL and re-subscribes every registered topic.
class LifecycleController {
public:
    explicit LifecycleController(std::shared_ptr<SessionController> session);

    // onPaused runs on the session strand once the connection is closed.
    void pause(std::function<void()> onPaused = {});
    void resume();

    // Convenience for hosts that only report "visible or not".
    void hostStateChanged(bool foreground);

    [[nodiscard]] bool isPaused() const { return m_paused.load(); }

private:
    std::weak_ptr<SessionController> m_session;
    std::atomic<bool>                m_paused{false};
};
