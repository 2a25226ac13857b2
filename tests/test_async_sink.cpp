#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <tierlog/log_async_sink.hpp>
#include <tierlog/log_task_pool.hpp>

#include <atomic>
#include <chrono>
#include <latch>
#include <new>
#include <stdexcept>
#include <thread>

#include "capture_sink.hpp"

using namespace tierlog;
using namespace std::chrono_literals;
using tierlog::testing::capture_sink;
using tierlog::testing::failing_sink;
using Catch::Matchers::ContainsSubstring;

namespace
{

// Blocks every delivery until the test opens the gate
class gated_sink final : public log_sink
{
  public:
    gated_sink() : log_sink("gated") {}

    log_error log(log_level, int, record &rec) override
    {
        entered.count_down();
        gate.wait();
        message = rec.message();
        done.store(true);
        return {};
    }

    std::latch entered{1};
    std::latch gate{1};
    std::atomic<bool> done{false};
    std::string message;
};

// Throws from every delivery instead of returning an error
class throwing_sink final : public log_sink
{
  public:
    explicit throwing_sink(bool std_exception) : log_sink("throwing"), std_exception_(std_exception) {}

    log_error log(log_level, int, record &) override
    {
        if (std_exception_) throw std::logic_error("no backend installed");
        throw 42;
    }

    log_error print(const arg_list &) override { throw std::bad_alloc(); }

  private:
    bool std_exception_;
};

struct diagnostics_fixture
{
    std::shared_ptr<capture_sink> captured = std::make_shared<capture_sink>("diagnostics");
    std::shared_ptr<logger> diagnostics =
        std::make_shared<logger>("tierlog.sinks", std::make_shared<module_level_backend>(captured));
    std::shared_ptr<task_pool> pool = std::make_shared<task_pool>(2);
};

} // namespace

TEST_CASE("Task pool", "[async][task_pool]")
{
    SECTION("Runs submitted tasks")
    {
        task_pool pool(3);
        REQUIRE(pool.workers() == 3);

        std::atomic<int> ran{0};
        for (int i = 0; i < 100; ++i) { REQUIRE(pool.submit([&]() { ran.fetch_add(1); })); }

        REQUIRE(pool.wait_idle(2s));
        REQUIRE(ran.load() == 100);
        REQUIRE(pool.pending() == 0);
    }

    SECTION("Refuses tasks after shutdown")
    {
        task_pool pool(1);
        pool.shutdown();
        REQUIRE(pool.is_shutdown());
        REQUIRE_FALSE(pool.submit([]() {}));
        REQUIRE_NOTHROW(pool.shutdown());
    }

    SECTION("Queued tasks are discarded and counted on shutdown")
    {
        task_pool pool(1);
        std::latch started{1};
        std::latch release{1};

        REQUIRE(pool.submit(
            [&]()
            {
                started.count_down();
                release.wait();
            }));
        started.wait();

        std::atomic<int> ran{0};
        for (int i = 0; i < 5; ++i) { REQUIRE(pool.submit([&]() { ran.fetch_add(1); })); }

        std::thread stopper([&]() { pool.shutdown(); });
        std::this_thread::sleep_for(TASK_POOL_POLL_INTERVAL * 2);
        release.count_down();
        stopper.join();

        REQUIRE(ran.load() == 0);
        REQUIRE(pool.discarded() == 5);
    }

    SECTION("A throwing task does not take a worker down")
    {
        task_pool pool(1);
        REQUIRE(pool.submit([]() { throw std::runtime_error("task failure"); }));
        REQUIRE(pool.submit([]() { throw 7; }));

        std::atomic<bool> ran{false};
        REQUIRE(pool.submit([&]() { ran = true; }));
        REQUIRE(pool.wait_idle(2s));
        REQUIRE(ran.load());
    }
}

TEST_CASE("Synchronous delivery", "[async]")
{
    diagnostics_fixture fx;

    SECTION("Runs on the caller's thread and returns the sink's result")
    {
        auto inner = std::make_shared<capture_sink>();
        async_sink sink("sync", inner, delivery_mode::sync, nullptr);

        auto rec = make_record("m", log_level::info, "now");
        REQUIRE_FALSE(sink.log(log_level::info, 0, rec));
        REQUIRE(inner->messages() == std::vector<std::string>{"now"});
        REQUIRE(inner->entries()[0].calldepth == 1);
    }

    SECTION("Errors reach the caller")
    {
        async_sink sink("sync", std::make_shared<failing_sink>(), delivery_mode::sync, fx.pool, fx.diagnostics);

        auto rec = make_record("m", log_level::info, "x");
        REQUIRE(sink.log(log_level::info, 0, rec));
        REQUIRE(sink.print(make_args("x")));
        REQUIRE(fx.captured->count() == 0);
    }
}

TEST_CASE("Asynchronous delivery", "[async]")
{
    diagnostics_fixture fx;

    SECTION("log() returns before a slow sink finishes")
    {
        auto inner = std::make_shared<gated_sink>();
        async_sink sink("slow", inner, delivery_mode::async, fx.pool, fx.diagnostics);

        auto rec = make_record("m", log_level::info, "eventually");
        REQUIRE_FALSE(sink.log(log_level::info, 0, rec));

        inner->entered.wait();
        REQUIRE_FALSE(inner->done.load());

        inner->gate.count_down();
        REQUIRE(fx.pool->wait_idle(2s));
        REQUIRE(inner->done.load());
        REQUIRE(inner->message == "eventually");
    }

    SECTION("The caller's record is left untouched")
    {
        auto inner = std::make_shared<capture_sink>();
        async_sink sink("async", inner, delivery_mode::async, fx.pool, fx.diagnostics);

        auto rec = make_record("m", log_level::info, "snap");
        REQUIRE_FALSE(sink.log(log_level::info, 0, rec));
        REQUIRE(inner->wait_for(1));
        REQUIRE_FALSE(rec.has_message());
        REQUIRE(inner->entries()[0].data.id == rec.id());
    }

    SECTION("A failing sink produces exactly one diagnostic entry and no caller error")
    {
        auto inner = std::make_shared<failing_sink>("broken-file");
        async_sink sink("broken-file", inner, delivery_mode::async, fx.pool, fx.diagnostics);

        auto rec = make_record("m", log_level::error, "lost");
        REQUIRE_FALSE(sink.log(log_level::error, 0, rec));
        REQUIRE(fx.pool->wait_idle(2s));

        auto entries = fx.captured->entries();
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].data.module == "tierlog.sinks");
        REQUIRE(entries[0].data.level == log_level::error);
        REQUIRE_THAT(entries[0].data.message, ContainsSubstring("broken-file"));
        REQUIRE(inner->attempts() == 1);
    }

    SECTION("A throwing sink is reported like a failing one")
    {
        async_sink sink("throwing", std::make_shared<throwing_sink>(true), delivery_mode::async, fx.pool,
                        fx.diagnostics);

        auto rec = make_record("m", log_level::error, "lost");
        REQUIRE_FALSE(sink.log(log_level::error, 0, rec));
        REQUIRE_FALSE(sink.print(make_args("lost")));
        REQUIRE(fx.pool->wait_idle(2s));

        auto messages = fx.captured->messages();
        REQUIRE(messages.size() == 2);
        for (const auto &m : messages) REQUIRE_THAT(m, ContainsSubstring("throwing"));
        REQUIRE_THAT(messages[0] + messages[1], ContainsSubstring("no backend installed"));
    }

    SECTION("A non-standard throw does not reach the worker")
    {
        async_sink sink("throwing", std::make_shared<throwing_sink>(false), delivery_mode::async, fx.pool,
                        fx.diagnostics);

        auto rec = make_record("m", log_level::error, "lost");
        REQUIRE_FALSE(sink.log(log_level::error, 0, rec));
        REQUIRE(fx.pool->wait_idle(2s));

        auto messages = fx.captured->messages();
        REQUIRE(messages.size() == 1);
        REQUIRE_THAT(messages[0], ContainsSubstring("unknown exception"));

        std::atomic<bool> ran{false};
        REQUIRE(fx.pool->submit([&]() { ran = true; }));
        REQUIRE(fx.pool->wait_idle(2s));
        REQUIRE(ran.load());
    }

    SECTION("print() is delivered in the background too")
    {
        auto inner = std::make_shared<capture_sink>();
        async_sink sink("async", inner, delivery_mode::async, fx.pool, fx.diagnostics);

        REQUIRE_FALSE(sink.print(make_args("raw", 1)));
        REQUIRE(fx.pool->wait_idle(2s));
        REQUIRE(inner->printed() == std::vector<std::string>{"raw 1"});
    }

    SECTION("A refused submission is reported, not returned")
    {
        auto inner = std::make_shared<capture_sink>();
        async_sink sink("async", inner, delivery_mode::async, fx.pool, fx.diagnostics);
        fx.pool->shutdown();

        auto rec = make_record("m", log_level::info, "too late");
        REQUIRE_FALSE(sink.log(log_level::info, 0, rec));
        REQUIRE(inner->count() == 0);

        auto messages = fx.captured->messages();
        REQUIRE(messages.size() == 1);
        REQUIRE_THAT(messages[0], ContainsSubstring("refused"));
    }

    SECTION("Async mode needs a pool")
    {
        REQUIRE_THROWS_AS(async_sink("x", std::make_shared<capture_sink>(), delivery_mode::async, nullptr),
                          std::invalid_argument);
    }
}
