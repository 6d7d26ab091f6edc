#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include "LifecycleController.hpp"

// Terminal-host lifecycle: SIGTSTP (Ctrl-Z) pauses the session and then stops the
// process; SIGCONT (fg/bg) resumes it. Handlers run on the supplied io_context.
class PosixLifecycleHook {
public:
    PosixLifecycleHook(boost::asio::io_context& ioc, LifecycleController& lifecycle);
    ~PosixLifecycleHook();

    PosixLifecycleHook(const PosixLifecycleHook&) = delete;
    PosixLifecycleHook& operator=(const PosixLifecycleHook&) = delete;

    void start();
    void stop();

private:
    void arm();
    void onSignal(int signo);

    boost::asio::signal_set m_signals;
    LifecycleController&    m_lifecycle;
    bool                    m_running{false};
};
