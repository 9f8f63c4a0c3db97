#include <catch2/catch_test_macros.hpp>

#include "service/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("WorkerPool", "[pool]") {

    SECTION("ReturnsResults") {
        WorkerPool pool(2);
        auto a = pool.submit([] { return 20; });
        auto b = pool.submit([] { return std::string("done"); });
        REQUIRE(a.get() == 20);
        REQUIRE(b.get() == "done");
    }

    SECTION("ZeroWorkersMeansOne") {
        WorkerPool pool(0);
        REQUIRE(pool.size() == 1);
        REQUIRE(pool.submit([] { return 1; }).get() == 1);
    }

    SECTION("ConcurrencyBoundedByWorkers") {
        std::atomic<int> running{0};
        std::atomic<int> peak{0};
        {
            WorkerPool pool(3);
            for (int i = 0; i < 12; ++i) {
                pool.submit([&] {
                    int now = ++running;
                    int prev = peak.load();
                    while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
                    std::this_thread::sleep_for(5ms);
                    --running;
                });
            }
        }
        REQUIRE(peak <= 3);
        REQUIRE(peak >= 1);
    }

    SECTION("ShutdownDrainsQueuedWork") {
        std::atomic<int> done{0};
        WorkerPool pool(1);
        for (int i = 0; i < 10; ++i) {
            pool.submit([&] {
                std::this_thread::sleep_for(1ms);
                ++done;
            });
        }
        pool.shutdown();
        REQUIRE(done == 10);
        REQUIRE(pool.pending() == 0);
    }

    SECTION("RefusedAfterShutdown") {
        WorkerPool pool(1);
        pool.shutdown();
        auto fut = pool.submit([] { return 1; });
        REQUIRE_THROWS_AS(fut.get(), std::future_error);
    }

    SECTION("ExceptionsReachTheFuture") {
        WorkerPool pool(1);
        auto fut = pool.submit([]() -> int { throw std::runtime_error("boom"); });
        REQUIRE_THROWS_AS(fut.get(), std::runtime_error);
        REQUIRE(pool.submit([] { return 2; }).get() == 2);
    }
}
