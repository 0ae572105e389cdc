#ifndef CHUNKRELAY_SESSION_CLEANUP_SCHEDULER_H
#define CHUNKRELAY_SESSION_CLEANUP_SCHEDULER_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace chunkrelay {

using CleanupHandle = uint64_t;

// Delay queue for deferred session teardown. Each scheduled task fires the
// cleanup callback for its transfer id once its deadline passes, on the
// scheduler's worker thread. Tasks can be withdrawn through their handle.
class CleanupScheduler {
public:
    using CleanupCallback = std::function<void(const std::string& transfer_id)>;
    using Clock = std::chrono::steady_clock;

    CleanupScheduler(std::chrono::milliseconds delay, CleanupCallback callback);
    ~CleanupScheduler();

    CleanupScheduler(const CleanupScheduler&) = delete;
    CleanupScheduler& operator=(const CleanupScheduler&) = delete;

    // Start the worker thread
    bool start();

    // Stop the worker thread. Pending tasks are dropped.
    void stop();

    bool is_running() const;

    // Arm a task after the configured delay
    CleanupHandle schedule(const std::string& transfer_id);

    // Arm a task after an explicit delay
    CleanupHandle schedule_after(const std::string& transfer_id, std::chrono::milliseconds delay);

    // Withdraw a pending task. Returns false if it already fired or never existed.
    bool cancel(CleanupHandle handle);

    // Most recent pending handle for a transfer
    std::optional<CleanupHandle> handle_for(const std::string& transfer_id) const;

    size_t pending() const;

    // Fire every task due at `now` on the calling thread. Returns how many ran.
    size_t run_due(Clock::time_point now);

    std::chrono::milliseconds delay() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace chunkrelay

#endif // CHUNKRELAY_SESSION_CLEANUP_SCHEDULER_H
