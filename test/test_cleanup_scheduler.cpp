#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "chunkrelay/session/cleanup_scheduler.h"

using namespace chunkrelay;
using namespace std::chrono_literals;

namespace {

// Records fired transfer ids across threads
struct FiredLog {
    std::mutex mutex;
    std::vector<std::string> ids;

    void add(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex);
        ids.push_back(id);
    }

    std::vector<std::string> get() {
        std::lock_guard<std::mutex> lock(mutex);
        return ids;
    }
};

} // anonymous namespace

TEST_CASE("Scheduler Fires Due Tasks In Deadline Order", "[scheduler]") {
    FiredLog fired;
    CleanupScheduler scheduler(1h, [&fired](const std::string& id) { fired.add(id); });

    scheduler.schedule_after("late", 30min);
    scheduler.schedule_after("early", 10min);
    scheduler.schedule("default");
    REQUIRE(scheduler.pending() == 3);
    REQUIRE(scheduler.delay() == 1h);

    auto now = CleanupScheduler::Clock::now();
    REQUIRE(scheduler.run_due(now) == 0);
    REQUIRE(scheduler.run_due(now + 20min) == 1);
    REQUIRE(scheduler.run_due(now + 2h) == 2);

    REQUIRE(fired.get() == std::vector<std::string>{"early", "late", "default"});
    REQUIRE(scheduler.pending() == 0);
}

TEST_CASE("Scheduler Cancel", "[scheduler][cancel]") {
    FiredLog fired;
    CleanupScheduler scheduler(1h, [&fired](const std::string& id) { fired.add(id); });

    auto keep = scheduler.schedule("keep");
    auto drop = scheduler.schedule("drop");
    REQUIRE(keep != drop);
    REQUIRE(scheduler.handle_for("drop") == drop);

    REQUIRE(scheduler.cancel(drop));
    REQUIRE_FALSE(scheduler.cancel(drop));
    REQUIRE_FALSE(scheduler.cancel(9999));
    REQUIRE_FALSE(scheduler.handle_for("drop").has_value());
    REQUIRE(scheduler.pending() == 1);

    scheduler.run_due(CleanupScheduler::Clock::now() + 2h);
    REQUIRE(fired.get() == std::vector<std::string>{"keep"});

    // Fired tasks can no longer be cancelled
    REQUIRE_FALSE(scheduler.cancel(keep));
}

TEST_CASE("Scheduler Tracks Latest Handle Per Transfer", "[scheduler]") {
    CleanupScheduler scheduler(1h, [](const std::string&) {});

    auto first = scheduler.schedule("t1");
    auto second = scheduler.schedule("t1");
    REQUIRE(scheduler.handle_for("t1") == second);
    REQUIRE(scheduler.pending() == 2);

    // Cancelling the older task leaves the newest one visible
    REQUIRE(scheduler.cancel(first));
    REQUIRE(scheduler.handle_for("t1") == second);
}

TEST_CASE("Scheduler Worker Fires After Delay", "[scheduler][thread]") {
    FiredLog fired;
    CleanupScheduler scheduler(20ms, [&fired](const std::string& id) { fired.add(id); });
    REQUIRE(scheduler.start());
    REQUIRE(scheduler.is_running());

    scheduler.schedule("t1");

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (fired.get().empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }

    REQUIRE(fired.get() == std::vector<std::string>{"t1"});
    REQUIRE(scheduler.pending() == 0);

    scheduler.stop();
    REQUIRE_FALSE(scheduler.is_running());
}

TEST_CASE("Scheduler Worker Wakes For Earlier Task", "[scheduler][thread]") {
    FiredLog fired;
    CleanupScheduler scheduler(1h, [&fired](const std::string& id) { fired.add(id); });
    REQUIRE(scheduler.start());

    scheduler.schedule("slow");
    scheduler.schedule_after("fast", 10ms);

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (fired.get().empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }

    REQUIRE(fired.get() == std::vector<std::string>{"fast"});
    REQUIRE(scheduler.pending() == 1);
    scheduler.stop();
}

TEST_CASE("Scheduler Stop Drops Pending Tasks", "[scheduler][thread]") {
    std::atomic<int> calls{0};
    CleanupScheduler scheduler(1h, [&calls](const std::string&) { calls++; });
    REQUIRE(scheduler.start());

    scheduler.schedule("t1");
    scheduler.schedule("t2");
    REQUIRE(scheduler.pending() == 2);

    scheduler.stop();
    REQUIRE(scheduler.pending() == 0);
    REQUIRE(calls.load() == 0);

    // Stop is idempotent
    scheduler.stop();
}

TEST_CASE("Scheduler Survives Throwing Callback", "[scheduler][error]") {
    FiredLog fired;
    CleanupScheduler scheduler(1h, [&fired](const std::string& id) {
        if (id == "bad") {
            throw std::runtime_error("boom");
        }
        fired.add(id);
    });

    scheduler.schedule_after("bad", 1ms);
    scheduler.schedule_after("good", 2ms);

    REQUIRE(scheduler.run_due(CleanupScheduler::Clock::now() + 1s) == 2);
    REQUIRE(fired.get() == std::vector<std::string>{"good"});
}
