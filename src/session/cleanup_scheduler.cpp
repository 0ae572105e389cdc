#include "chunkrelay/session/cleanup_scheduler.h"
#include "chunkrelay/base/logger.h"
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace chunkrelay {

struct CleanupScheduler::Impl {
    using Key = std::pair<Clock::time_point, CleanupHandle>;

    std::chrono::milliseconds delay;
    CleanupCallback callback;

    mutable std::mutex mutex;
    std::condition_variable cv;
    std::map<Key, std::string> queue;                        // ordered by deadline
    std::unordered_map<CleanupHandle, Clock::time_point> deadlines;
    std::unordered_map<std::string, CleanupHandle> latest;   // transfer_id -> newest handle
    CleanupHandle next_handle = 1;
    bool running = false;
    std::thread worker;

    Impl(std::chrono::milliseconds d, CleanupCallback cb)
        : delay(d), callback(std::move(cb)) {}

    // Caller holds mutex
    std::vector<std::pair<CleanupHandle, std::string>> take_due(Clock::time_point now) {
        std::vector<std::pair<CleanupHandle, std::string>> due;
        while (!queue.empty() && queue.begin()->first.first <= now) {
            auto it = queue.begin();
            CleanupHandle handle = it->first.second;
            due.emplace_back(handle, std::move(it->second));
            queue.erase(it);
            deadlines.erase(handle);

            auto latest_it = latest.find(due.back().second);
            if (latest_it != latest.end() && latest_it->second == handle) {
                latest.erase(latest_it);
            }
        }
        return due;
    }

    void fire(const std::vector<std::pair<CleanupHandle, std::string>>& due) {
        for (const auto& [handle, transfer_id] : due) {
            Logger::instance().debug("Cleanup task {} firing for {}", handle, transfer_id);
            try {
                callback(transfer_id);
            } catch (const std::exception& e) {
                Logger::instance().error("Cleanup of " + transfer_id + " failed: " + e.what());
            }
        }
    }

    void run_loop() {
        std::unique_lock<std::mutex> lock(mutex);
        while (running) {
            if (queue.empty()) {
                cv.wait(lock, [this] { return !running || !queue.empty(); });
                continue;
            }

            auto deadline = queue.begin()->first.first;
            if (cv.wait_until(lock, deadline) == std::cv_status::no_timeout) {
                // Woken early: new task, cancel or stop. Re-evaluate.
                continue;
            }

            auto due = take_due(Clock::now());
            if (due.empty()) {
                continue;
            }
            lock.unlock();
            fire(due);
            lock.lock();
        }
    }
};

CleanupScheduler::CleanupScheduler(std::chrono::milliseconds delay, CleanupCallback callback)
    : impl_(std::make_unique<Impl>(delay, std::move(callback))) {}

CleanupScheduler::~CleanupScheduler() {
    stop();
}

bool CleanupScheduler::start() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->running) {
        Logger::instance().warning("Cleanup scheduler already running");
        return true;
    }
    impl_->running = true;
    impl_->worker = std::thread([this]() { impl_->run_loop(); });
    Logger::instance().info("Cleanup scheduler started (delay {} ms)", impl_->delay.count());
    return true;
}

void CleanupScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (!impl_->running) {
            return;
        }
        impl_->running = false;
        if (!impl_->queue.empty()) {
            Logger::instance().info("Dropping {} pending cleanup task(s)", impl_->queue.size());
        }
        impl_->queue.clear();
        impl_->deadlines.clear();
        impl_->latest.clear();
    }
    impl_->cv.notify_all();

    if (impl_->worker.joinable()) {
        impl_->worker.join();
    }
    Logger::instance().info("Cleanup scheduler stopped");
}

bool CleanupScheduler::is_running() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->running;
}

CleanupHandle CleanupScheduler::schedule(const std::string& transfer_id) {
    return schedule_after(transfer_id, impl_->delay);
}

CleanupHandle CleanupScheduler::schedule_after(const std::string& transfer_id,
                                               std::chrono::milliseconds delay) {
    CleanupHandle handle;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        handle = impl_->next_handle++;
        auto deadline = Clock::now() + delay;
        impl_->queue.emplace(Impl::Key{deadline, handle}, transfer_id);
        impl_->deadlines[handle] = deadline;
        impl_->latest[transfer_id] = handle;
    }
    impl_->cv.notify_all();

    Logger::instance().debug("Cleanup of {} scheduled in {} ms (task {})",
                             transfer_id, delay.count(), handle);
    return handle;
}

bool CleanupScheduler::cancel(CleanupHandle handle) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->deadlines.find(handle);
        if (it == impl_->deadlines.end()) {
            return false;
        }

        auto queue_it = impl_->queue.find(Impl::Key{it->second, handle});
        if (queue_it != impl_->queue.end()) {
            auto latest_it = impl_->latest.find(queue_it->second);
            if (latest_it != impl_->latest.end() && latest_it->second == handle) {
                impl_->latest.erase(latest_it);
            }
            impl_->queue.erase(queue_it);
        }
        impl_->deadlines.erase(it);
    }
    impl_->cv.notify_all();
    return true;
}

std::optional<CleanupHandle> CleanupScheduler::handle_for(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->latest.find(transfer_id);
    if (it == impl_->latest.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t CleanupScheduler::pending() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->queue.size();
}

size_t CleanupScheduler::run_due(Clock::time_point now) {
    std::vector<std::pair<CleanupHandle, std::string>> due;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        due = impl_->take_due(now);
    }
    impl_->fire(due);
    return due.size();
}

std::chrono::milliseconds CleanupScheduler::delay() const {
    return impl_->delay;
}

} // namespace chunkrelay
