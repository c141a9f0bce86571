#pragma once

#include "logger.h"
#include <thread>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <string>

namespace skyshare {

/**
 * ThreadManager provides thread management capabilities for classes that
 * run background workers and need graceful shutdown coordination.
 */
class ThreadManager {
public:
    ThreadManager();
    virtual ~ThreadManager();

    /**
     * Add a managed thread with a descriptive name
     * @param t Thread to be managed (moved)
     * @param name Descriptive name for logging purposes
     */
    void add_managed_thread(std::thread&& t, const std::string& name);

    /**
     * Signal all threads to shutdown and notify waiting threads
     */
    void shutdown_all_threads();

    /**
     * Join all active threads and wait for them to finish
     */
    void join_all_active_threads();

    bool is_shutdown_requested() const { return shutdown_requested_.load(); }

protected:
    /**
     * Condition variable for coordinating thread shutdown.
     * Workers wait on it between iterations and re-check their flags.
     */
    std::condition_variable shutdown_cv_;

    /**
     * Mutex for the shutdown condition variable
     */
    std::mutex shutdown_mutex_;

    /**
     * Notify all waiting threads to wake up (typically for shutdown)
     */
    void notify_shutdown();

private:
    std::vector<std::thread> active_threads_;
    mutable std::mutex active_threads_mutex_;
    std::atomic<bool> shutdown_requested_;

    // Prevent copying
    ThreadManager(const ThreadManager&) = delete;
    ThreadManager& operator=(const ThreadManager&) = delete;
};

} // namespace skyshare
