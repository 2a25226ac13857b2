#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <tierlog/log_logger.hpp>
#include <tierlog/log_context.hpp>

#include <memory>
#include <string>
#include <vector>

#include "capture_sink.hpp"

using namespace tierlog;
using tierlog::testing::capture_sink;
using tierlog::testing::failing_sink;
using Catch::Matchers::EndsWith;

namespace
{

struct api_key
{
    std::string value;
    std::string redacted() const { return value.substr(0, 2) + redact(value.substr(2)); }
};

// Keeps the last record's location
class source_sink final : public log_sink
{
  public:
    source_sink() : log_sink("source") {}

    log_error log(log_level lvl, int, record &rec) override
    {
        message = rec.message();
        level   = lvl;
        file    = rec.file();
        line    = rec.line();
        return {};
    }

    std::string message;
    log_level level = log_level::debug;
    std::string file;
    uint32_t line = 0;
};

struct logger_fixture
{
    std::shared_ptr<capture_sink> sink         = std::make_shared<capture_sink>();
    std::shared_ptr<module_level_backend> back = std::make_shared<module_level_backend>(sink);
    std::shared_ptr<logger> log                = std::make_shared<logger>("svc.api", back);
};

} // namespace

TEST_CASE("Logger level methods", "[logger]")
{
    logger_fixture fx;

    fx.log->critical("c");
    fx.log->error("e");
    fx.log->warning("w");
    fx.log->notice("n");
    fx.log->info("i");
    fx.log->debug("d");

    auto entries = fx.sink->entries();
    REQUIRE(entries.size() == 6);
    REQUIRE(entries[0].data.level == log_level::critical);
    REQUIRE(entries[1].data.level == log_level::error);
    REQUIRE(entries[2].data.level == log_level::warning);
    REQUIRE(entries[3].data.level == log_level::notice);
    REQUIRE(entries[4].data.level == log_level::info);
    REQUIRE(entries[5].data.level == log_level::debug);
    for (const auto &e : entries)
    {
        REQUIRE(e.data.module == "svc.api");
        REQUIRE(e.level == e.data.level);
    }
}

TEST_CASE("Logger format variants", "[logger]")
{
    logger_fixture fx;

    fx.log->criticalf("{} {}", "a", 1);
    fx.log->errorf("{:>4}", 7);
    fx.log->warningf("{:.2f}", 3.14159);
    fx.log->noticef("{}-{}", 'x', 'y');
    fx.log->infof("{1} {0}", "world", "hello");
    fx.log->debugf("no args");

    REQUIRE(fx.sink->messages() == std::vector<std::string>{"a 1", "   7", "3.14", "x-y", "hello world", "no args"});
}

TEST_CASE("Logger level gate", "[logger]")
{
    logger_fixture fx;
    fx.back->set_level(log_level::warning, "svc");

    REQUIRE_FALSE(fx.log->is_enabled_for(log_level::info));
    REQUIRE(fx.log->is_enabled_for(log_level::warning));

    auto before = record_sequence::current();
    fx.log->info("dropped");
    fx.log->debugf("dropped {}", 1);
    REQUIRE(record_sequence::current() == before);

    fx.log->error("kept");
    REQUIRE(fx.sink->messages() == std::vector<std::string>{"kept"});
}

TEST_CASE("Logger calldepth", "[logger]")
{
    logger_fixture fx;

    fx.log->info("x");
    int base = fx.sink->entries()[0].calldepth;
    REQUIRE(base > 0);

    fx.log->extra_calldepth = 2;
    fx.log->info("y");
    REQUIRE(fx.sink->entries()[1].calldepth == base + 2);
}

TEST_CASE("Logger source location", "[logger]")
{
    auto sink    = std::make_shared<source_sink>();
    auto backend = std::make_shared<module_level_backend>(sink);
    auto log     = std::make_shared<logger>("svc", backend);

    SECTION("Macros attach file and line")
    {
        uint32_t line = __LINE__ + 1;
        TIERLOG_NOTICEF(*log, "port {}", 8080);

        REQUIRE(sink->message == "port 8080");
        REQUIRE(sink->level == log_level::notice);
        REQUIRE_THAT(sink->file, EndsWith("test_logger.cpp"));
        REQUIRE(sink->line == line);
    }

    SECTION("Plain calls carry no location")
    {
        log->info("anonymous");
        REQUIRE(sink->file.empty());
        REQUIRE(sink->line == 0);
    }

    SECTION("Macros work through a prefix logger")
    {
        prefix_logger conn(log, "conn#1");
        TIERLOG_ERRORF(conn, "reset by {}", "peer");
        REQUIRE(sink->message == "conn#1 -> reset by peer");
        REQUIRE(sink->line > 0);
    }
}

TEST_CASE("Logger delivery errors do not reach the caller", "[logger]")
{
    auto backend = std::make_shared<module_level_backend>(std::make_shared<failing_sink>());
    logger log("m", backend);
    REQUIRE_NOTHROW(log.error("goes nowhere"));
}

TEST_CASE("Logger panic", "[logger][panic]")
{
    logger_fixture fx;

    SECTION("Logs at CRITICAL then throws the message")
    {
        REQUIRE_THROWS_AS(fx.log->panic("state", 42, "corrupt"), log_panic);
        auto entries = fx.sink->entries();
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].data.level == log_level::critical);
        REQUIRE(entries[0].data.message == "state 42 corrupt");

        try
        {
            fx.log->panicf("bad {}", "input");
        }
        catch (const log_panic &e)
        {
            REQUIRE(std::string(e.what()) == "bad input");
        }
    }

    SECTION("The exception text is redacted")
    {
        try
        {
            fx.log->panicf("key {}", api_key{"sk12345"});
            FAIL("panicf should have thrown");
        }
        catch (const log_panic &e)
        {
            REQUIRE(std::string(e.what()) == "key sk*****");
        }
        REQUIRE(fx.sink->messages() == std::vector<std::string>{"key sk*****"});
    }

    SECTION("Throws even when CRITICAL is filtered out")
    {
        auto quiet_backend = std::make_shared<module_level_backend>(fx.sink);
        quiet_backend->set_level(static_cast<log_level>(LOG_LEVEL_COUNT));
        logger quiet("quiet", quiet_backend);

        REQUIRE_THROWS_AS(quiet.panic("still"), log_panic);
        REQUIRE(fx.sink->count() == 0);
    }
}

TEST_CASE("Prefix logger", "[logger][prefix]")
{
    logger_fixture fx;

    SECTION("Argument form gets the prefix as first argument")
    {
        prefix_logger conn(fx.log, "  conn#42  ");
        REQUIRE(conn.prefix() == "conn#42 ->");

        conn.info("closed", 3);
        REQUIRE(fx.sink->messages() == std::vector<std::string>{"conn#42 -> closed 3"});
    }

    SECTION("Format form gets the prefix in front of the format")
    {
        prefix_logger conn(fx.log, "worker", ":");
        conn.warningf("queue at {}%", 90);
        REQUIRE(fx.sink->messages() == std::vector<std::string>{"worker: queue at 90%"});
    }

    SECTION("Braces in the prefix are literal")
    {
        prefix_logger odd(fx.log, "{job}");
        odd.errorf("failed after {}s", 3);
        REQUIRE(fx.sink->messages() == std::vector<std::string>{"{job} -> failed after 3s"});
    }

    SECTION("Prefixes nest outermost last")
    {
        auto inner = std::make_shared<prefix_logger>(fx.log, "db");
        prefix_logger outer(inner, "tx7");
        outer.info("commit");
        REQUIRE(fx.sink->messages() == std::vector<std::string>{"db -> tx7 -> commit"});
    }

    SECTION("Level gate and panic go through the parent")
    {
        fx.back->set_level(log_level::error);
        prefix_logger conn(fx.log, "c");
        REQUIRE(conn.module() == "svc.api");
        REQUIRE_FALSE(conn.is_enabled_for(log_level::info));

        conn.info("dropped");
        REQUIRE(fx.sink->count() == 0);

        try
        {
            conn.panic("boom");
        }
        catch (const log_panic &e)
        {
            REQUIRE(std::string(e.what()) == "c -> boom");
        }
        REQUIRE(fx.sink->messages() == std::vector<std::string>{"c -> boom"});
    }
}

TEST_CASE("Logging context", "[context]")
{
    file_sink_cache files;
    context_options options;
    options.async_workers = 1;
    options.use_color     = false;
    options.files         = &files;
    logging_context ctx(options);

    auto sink = std::make_shared<capture_sink>();
    ctx.set_backend(sink);

    SECTION("Registry returns one logger per module")
    {
        auto a = ctx.get_or_create_logger("svc.api");
        auto b = ctx.get_or_create_logger("svc.api");
        REQUIRE(a == b);
        REQUIRE(ctx.get_logger("svc.api") == a);
        REQUIRE(ctx.get_logger("unknown") == nullptr);
    }

    SECTION("Registered loggers follow set_backend")
    {
        auto log = ctx.get_or_create_logger("svc");
        log->info("first");

        auto replacement = std::make_shared<capture_sink>();
        ctx.set_backend(replacement);
        log->info("second");

        REQUIRE(sink->messages() == std::vector<std::string>{"first"});
        REQUIRE(replacement->messages() == std::vector<std::string>{"second"});
    }

    SECTION("Levels apply to the current default backend")
    {
        ctx.set_level(log_level::info);
        ctx.set_level(log_level::warning, "svc.api");
        REQUIRE(ctx.get_level("svc.api.http") == log_level::warning);
        REQUIRE(ctx.get_level("svc.worker") == log_level::info);

        auto log = ctx.get_or_create_logger("svc.api.http");
        log->notice("suppressed");
        log->error("delivered");
        ctx.get_or_create_logger("svc.worker")->info("inherits default");

        REQUIRE(sink->messages() == std::vector<std::string>{"delivered", "inherits default"});
    }

    SECTION("Several sinks are fanned out")
    {
        auto second = std::make_shared<capture_sink>();
        ctx.set_backend({sink, second});
        ctx.get_or_create_logger("fan")->info("both");

        REQUIRE(sink->messages() == std::vector<std::string>{"both"});
        REQUIRE(second->messages() == std::vector<std::string>{"both"});
        REQUIRE_THROWS_AS(ctx.set_backend(std::vector<std::shared_ptr<log_sink>>{}), std::invalid_argument);
    }

    SECTION("bind_logger gives a module its own backend")
    {
        auto own     = std::make_shared<capture_sink>();
        auto backend = std::make_shared<module_level_backend>(own);
        auto bound   = ctx.bind_logger("audit", backend);

        REQUIRE(ctx.get_or_create_logger("audit") == bound);
        bound->notice("audited");
        REQUIRE(own->messages() == std::vector<std::string>{"audited"});
        REQUIRE(sink->count() == 0);
    }

    SECTION("Diagnostics logger")
    {
        REQUIRE(ctx.diagnostics()->module() == DIAGNOSTICS_MODULE);
        REQUIRE(ctx.tasks()->workers() == 1);

        auto services = ctx.services();
        REQUIRE(services.tasks == ctx.tasks());
        REQUIRE(services.diagnostics == ctx.diagnostics());
        REQUIRE(&ctx.files() == &files);
    }

    SECTION("reset() restores the initial state")
    {
        ctx.set_level(log_level::critical);
        ctx.get_or_create_logger("m")->info("x");
        ctx.reset();

        REQUIRE(record_sequence::current() == 0);
        REQUIRE(ctx.get_level() == log_level::debug);
        REQUIRE(ctx.default_backend() != nullptr);

        auto rec = make_record("m", log_level::info, "after reset");
        REQUIRE(rec.id() == 1);
    }
}
