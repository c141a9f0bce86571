#include "threadmanager.h"

// ThreadManager module logging macros
#define LOG_THREAD_DEBUG(message) LOG_DEBUG("thread", message)
#define LOG_THREAD_INFO(message)  LOG_INFO("thread", message)
#define LOG_THREAD_WARN(message)  LOG_WARN("thread", message)
#define LOG_THREAD_ERROR(message) LOG_ERROR("thread", message)

namespace skyshare {

ThreadManager::ThreadManager() : shutdown_requested_(false) {
}

ThreadManager::~ThreadManager() {
    join_all_active_threads();
}

void ThreadManager::add_managed_thread(std::thread&& t, const std::string& name) {
    std::lock_guard<std::mutex> lock(active_threads_mutex_);

    // A worker started after shutdown still runs to completion, it just exits on its first check
    if (shutdown_requested_.load()) {
        LOG_THREAD_WARN("Adding thread during shutdown: " << name);
    }

    active_threads_.emplace_back(std::move(t));
    LOG_THREAD_DEBUG("Added managed thread: " << name << " (total: " << active_threads_.size() << ")");
}

void ThreadManager::shutdown_all_threads() {
    LOG_THREAD_DEBUG("Initiating shutdown of all background threads");

    shutdown_requested_.store(true);
    notify_shutdown();
}

void ThreadManager::join_all_active_threads() {
    std::vector<std::thread> threads_to_join;

    {
        std::lock_guard<std::mutex> lock(active_threads_mutex_);
        if (active_threads_.empty()) {
            return;
        }

        // Join outside the lock
        threads_to_join = std::move(active_threads_);
        active_threads_.clear();
    }

    LOG_THREAD_DEBUG("Waiting for " << threads_to_join.size() << " managed threads to finish");

    for (auto& t : threads_to_join) {
        if (!t.joinable()) {
            continue;
        }
        if (t.get_id() == std::this_thread::get_id()) {
            LOG_THREAD_WARN("Worker asked to join itself, detaching instead");
            t.detach();
            continue;
        }
        try {
            t.join();
        } catch (const std::exception& e) {
            LOG_THREAD_ERROR("Exception while joining thread: " << e.what());
        }
    }

    LOG_THREAD_DEBUG("All managed threads have been cleaned up");
}

void ThreadManager::notify_shutdown() {
    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    shutdown_cv_.notify_all();
}

} // namespace skyshare
