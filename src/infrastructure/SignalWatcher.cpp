/**
 * @file SignalWatcher.cpp
 * @brief Implementation of SignalWatcher.
 */

#include "infrastructure/SignalWatcher.hpp"

#include <cstring>
#include <iostream>
#include <pthread.h>

namespace submitkit::infrastructure {

SignalWatcher::SignalWatcher() {
    sigemptyset(&m_signals);
    sigaddset(&m_signals, SIGINT);
    sigaddset(&m_signals, SIGTERM);
    int rc = pthread_sigmask(SIG_BLOCK, &m_signals, nullptr);
    if (rc != 0) {
        std::cerr << "[SignalWatcher] pthread_sigmask failed: " << std::strerror(rc) << std::endl;
    }
}

SignalWatcher::~SignalWatcher() {
    stop();
}

void SignalWatcher::start(std::function<void(int)> onSignal) {
    if (m_thread.joinable()) return;
    m_onSignal = std::move(onSignal);
    m_thread = std::thread(&SignalWatcher::watchLoop, this);
}

void SignalWatcher::stop() {
    if (!m_thread.joinable()) return;
    m_stopping = true;
    // A targeted SIGTERM wakes sigwait(); the stopping flag keeps it from the callback.
    if (!m_finished) {
        pthread_kill(m_thread.native_handle(), SIGTERM);
    }
    m_thread.join();
}

void SignalWatcher::watchLoop() {
    int sig = 0;
    int rc = sigwait(&m_signals, &sig);
    if (rc != 0) {
        std::cerr << "[SignalWatcher] sigwait failed: " << std::strerror(rc) << std::endl;
    } else if (!m_stopping) {
        std::cout << "[SignalWatcher] Received signal " << sig << ", shutting down." << std::endl;
        m_triggered = true;
        if (m_onSignal) m_onSignal(sig);
    }
    m_finished = true;
}

} // namespace submitkit::infrastructure
