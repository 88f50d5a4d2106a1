#include <catch2/catch_all.hpp>
#include "restbridge/core/util/thread_pool.hpp"
#include "restbridge/core/util/logger.hpp"
#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

using namespace restbridge;

TEST_CASE("Queued tasks all run before join returns", "[pool]") {
    std::atomic<int> done{ 0 };
    ThreadPool pool(4);
    REQUIRE(pool.getThreadCount() == 4);

    for (int i = 0; i < 100; ++i)
        pool.add([&] { ++done; });
    pool.join();

    REQUIRE(done == 100);
    REQUIRE(pool.getPendingTaskCount() == 0);
    REQUIRE(pool.isStopped());
}

TEST_CASE("A stopped pool refuses new tasks", "[pool]") {
    ThreadPool pool(1);
    pool.join();
    REQUIRE_THROWS_AS(pool.add([] {}), std::runtime_error);
}

TEST_CASE("A throwing task is logged and the worker survives", "[pool]") {
    std::vector<std::string> logged;
    Logger::inst().setSink([&](LogLevel lvl, const std::string& msg) {
        if (lvl == LogLevel::Error) logged.push_back(msg);
    });

    std::atomic<int> done{ 0 };
    {
        ThreadPool pool(1);
        pool.add([] { throw std::runtime_error("bad task"); });
        pool.add([&] { ++done; });
    }
    Logger::inst().setSink(nullptr);

    REQUIRE(done == 1);
    REQUIRE(logged.size() == 1);
    REQUIRE(logged.front() == "[ThreadPool] task failed: bad task");
}

TEST_CASE("A task throwing a non-exception type does not kill the worker", "[pool]") {
    std::vector<std::string> logged;
    Logger::inst().setSink([&](LogLevel lvl, const std::string& msg) {
        if (lvl == LogLevel::Error) logged.push_back(msg);
    });

    std::atomic<int> done{ 0 };
    {
        ThreadPool pool(1);
        pool.add([] { throw 42; });
        pool.add([&] { ++done; });
    }
    Logger::inst().setSink(nullptr);

    REQUIRE(done == 1);
    REQUIRE(logged == std::vector<std::string>{ "[ThreadPool] task failed with a non-standard exception" });
}

TEST_CASE("Zero threads means hardware concurrency", "[pool]") {
    ThreadPool pool(0);
    REQUIRE(pool.getThreadCount() >= 1);
}
