#include "SignalWatcher.h"
#include "WamLog.h"

#include <csignal>
#include <iostream>
#include <system_error>
#include <thread>
#include <utility>

#include <pthread.h>
#include <signal.h>

static sigset_t watchedSignals() {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    return signals;
}

SignalWatcher::SignalWatcher(std::function<void()> cancelSearch)
    : m_cancelSearch(std::move(cancelSearch))
{
}

void SignalWatcher::start() {
    sigset_t signals = watchedSignals();
    int ret = pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    if (ret != 0) {
        throw std::system_error(ret, std::generic_category(), "pthread_sigmask");
    }

    std::thread(&SignalWatcher::run, this).detach();
    DEBUG_LOG("[SignalWatcher] Watching SIGINT/SIGTERM");
}

void SignalWatcher::beginSearch() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_searching = true;
    m_cancelRequested = false;
}

void SignalWatcher::endSearch() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_searching = false;
}

bool SignalWatcher::absorb(int sig) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_searching || m_cancelRequested) {
        return false;
    }

    m_cancelRequested = true;
    std::cout << "\n⚠️  Signal " << sig << " received, closing search window..." << std::endl;
    if (m_cancelSearch) {
        m_cancelSearch();
    }
    return true;
}

void SignalWatcher::run() {
    sigset_t signals = watchedSignals();

    while (true) {
        int sig = 0;
        if (sigwait(&signals, &sig) != 0) {
            continue;
        }
        if (absorb(sig)) {
            continue;
        }

        std::cout << "\n⚠️  Signal " << sig << " received, shutting down..." << std::endl;

        // Default action, delivered to this thread
        std::signal(sig, SIG_DFL);
        sigset_t only;
        sigemptyset(&only);
        sigaddset(&only, sig);
        pthread_sigmask(SIG_UNBLOCK, &only, nullptr);
        std::raise(sig);
    }
}
