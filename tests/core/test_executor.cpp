#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <slotingest/core/pipeline/executor.h>

#include <atomic>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

using namespace slotingest;

TEST_CASE("Executor - submit and collect") {
    Executor executor(4);
    CHECK(executor.get_num_threads() == 4);
    CHECK_FALSE(executor.is_running());

    SUBCASE("Submitting before start fails") {
        CHECK_THROWS_AS(executor.submit("early", []() { return 1; }),
                        std::runtime_error);
    }

    SUBCASE("Results come back through futures") {
        executor.start();
        REQUIRE(executor.is_running());

        std::vector<std::future<int>> futures;
        for (int i = 0; i < 32; ++i) {
            futures.push_back(
                executor.submit("square " + std::to_string(i),
                                [i]() { return i * i; }));
        }
        for (int i = 0; i < 32; ++i) {
            CHECK(futures[i].get() == i * i);
        }
        executor.shutdown();
        CHECK(executor.get_tasks_completed() == 32);
    }

    SUBCASE("Exceptions surface through the future") {
        executor.start();
        auto future = executor.submit("boom", []() -> int {
            throw std::runtime_error("boom");
        });
        CHECK_THROWS_WITH_AS(future.get(), "boom", std::runtime_error);
    }

    SUBCASE("Shutdown drains queued tasks") {
        executor.start();
        std::atomic<int> done{0};
        std::vector<std::future<void>> futures;
        for (int i = 0; i < 100; ++i) {
            futures.push_back(executor.submit("count", [&done]() { ++done; }));
        }
        executor.shutdown();
        CHECK(done.load() == 100);
        CHECK_FALSE(executor.is_running());
    }

    SUBCASE("Restart after shutdown") {
        executor.start();
        executor.shutdown();
        executor.start();
        CHECK(executor.submit("again", []() { return 7; }).get() == 7);
    }
}

TEST_CASE("Executor - zero threads uses the hardware") {
    Executor executor(0);
    CHECK(executor.get_num_threads() >= 1);
}
