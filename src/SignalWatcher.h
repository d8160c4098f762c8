/**
 * @file SignalWatcher.h
 * @brief SIGINT/SIGTERM handling for the command line front end
 *
 * Signals are blocked in every thread and taken synchronously by one
 * sigwait() thread, so the reaction runs in normal thread context.
 * The first signal during an SSDP search closes the search window;
 * any other signal terminates the process with the default action.
 */

#ifndef SIGNAL_WATCHER_H
#define SIGNAL_WATCHER_H

#include <functional>
#include <mutex>

class SignalWatcher {
public:
    explicit SignalWatcher(std::function<void()> cancelSearch);

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    // Call before any other thread is created: threads inherit the mask.
    // The watcher must outlive the process.
    void start();

    void beginSearch();
    void endSearch();

    // True when the signal was absorbed by cancelling a running search
    bool absorb(int sig);

    class SearchScope {
    public:
        explicit SearchScope(SignalWatcher& watcher) : m_watcher(watcher) { m_watcher.beginSearch(); }
        ~SearchScope() { m_watcher.endSearch(); }

        SearchScope(const SearchScope&) = delete;
        SearchScope& operator=(const SearchScope&) = delete;

    private:
        SignalWatcher& m_watcher;
    };

private:
    void run();

    std::function<void()> m_cancelSearch;

    std::mutex m_mutex;
    bool m_searching = false;
    bool m_cancelRequested = false;
};

#endif // SIGNAL_WATCHER_H
