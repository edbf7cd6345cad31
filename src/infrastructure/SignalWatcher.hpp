/**
 * @file SignalWatcher.hpp
 * @brief Delivers SIGINT/SIGTERM to a callback on an ordinary thread.
 */

#pragma once
#include <atomic>
#include <csignal>
#include <functional>
#include <thread>

namespace submitkit::infrastructure {

/**
 * @class SignalWatcher
 * @brief Waits for termination signals with sigwait() instead of a handler.
 *
 * The constructor blocks SIGINT and SIGTERM in the calling thread, so it must
 * run before any other thread is started: new threads inherit the mask and the
 * signals can then only be received by the watcher thread. The callback runs
 * on that thread and may do anything a normal thread can.
 */
class SignalWatcher {
public:
    SignalWatcher();
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    /** @brief Starts the watcher thread; the callback receives the signal number. */
    void start(std::function<void(int)> onSignal);

    /** @brief Wakes and joins the watcher thread without invoking the callback. */
    void stop();

    /** @brief True once a signal has been delivered to the callback. */
    bool triggered() const { return m_triggered; }

private:
    void watchLoop();

    sigset_t m_signals;
    std::function<void(int)> m_onSignal;
    std::thread m_thread;
    std::atomic<bool> m_stopping{false};
    std::atomic<bool> m_finished{false};
    std::atomic<bool> m_triggered{false};
};

} // namespace submitkit::infrastructure
