#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <tierlog/log_record.hpp>
#include <tierlog/log_formatters.hpp>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace tierlog;
using Catch::Matchers::ContainsSubstring;

namespace
{

// Counts how often it is rendered and never shows its raw value
struct secret
{
    std::string value;
    std::shared_ptr<std::atomic<int>> calls = std::make_shared<std::atomic<int>>(0);

    std::string redacted() const
    {
        calls->fetch_add(1);
        return redact(value);
    }
};

// Formatter that counts invocations and just emits "<module>|<message>"
class counting_formatter final : public log_formatter
{
  public:
    mutable std::atomic<int> calls{0};
    mutable std::atomic<int> last_calldepth{-1};

    void format(int calldepth, record &rec, fmt::memory_buffer &out) const override
    {
        calls.fetch_add(1);
        last_calldepth = calldepth;
        fmt::format_to(std::back_inserter(out), "{}|{}", rec.module(), rec.message());
    }
};

log_clock::time_point frozen_now()
{
    return log_clock::time_point(std::chrono::seconds(1700000000));
}

} // namespace

TEST_CASE("Record ids", "[record]")
{
    SECTION("Ids increase in creation order")
    {
        auto a = make_record("m", log_level::info, "a");
        auto b = make_record("m", log_level::info, "b");
        auto c = make_record("other", log_level::error, "c");

        REQUIRE(b.id() == a.id() + 1);
        REQUIRE(c.id() == b.id() + 1);
        REQUIRE(record_sequence::current() == c.id());
    }

    SECTION("Concurrently created records get a gapless range")
    {
        constexpr int threads     = 8;
        constexpr int per_thread  = 500;
        const uint64_t start      = record_sequence::current();

        std::vector<std::vector<uint64_t>> ids(threads);
        std::vector<std::thread> workers;
        for (int t = 0; t < threads; ++t)
        {
            workers.emplace_back(
                [&, t]()
                {
                    for (int i = 0; i < per_thread; ++i)
                    {
                        auto rec = make_record("concurrent", log_level::debug, i);
                        ids[t].push_back(rec.id());
                    }
                });
        }
        for (auto &w : workers) w.join();

        std::vector<uint64_t> all;
        for (auto &v : ids)
        {
            REQUIRE(std::is_sorted(v.begin(), v.end()));
            all.insert(all.end(), v.begin(), v.end());
        }
        std::sort(all.begin(), all.end());

        REQUIRE(all.size() == static_cast<size_t>(threads * per_thread));
        for (size_t i = 0; i < all.size(); ++i) { REQUIRE(all[i] == start + 1 + i); }
    }

    SECTION("Reset restarts numbering")
    {
        record_sequence::reset();
        auto rec = make_record("m", log_level::info, "first");
        REQUIRE(rec.id() == 1);
    }
}

TEST_CASE("Record message", "[record]")
{
    SECTION("Arguments are joined with single spaces")
    {
        auto rec = make_record("m", log_level::info, "took", 42, "ms", 1.5);
        REQUIRE(rec.message() == "took 42 ms 1.5");
    }

    SECTION("No arguments give an empty message")
    {
        auto rec = make_record("m", log_level::info);
        REQUIRE(rec.message().empty());
    }

    SECTION("Format strings are rendered with fmt")
    {
        auto rec = make_recordf("m", log_level::warning, "retry {} of {}: {}", 2, 5, std::string("timeout"));
        REQUIRE(rec.message() == "retry 2 of 5: timeout");
    }

    SECTION("Bad format strings do not throw")
    {
        auto rec = make_recordf("m", log_level::error, "value {} and {}", 1);
        std::string msg;
        REQUIRE_NOTHROW(msg = rec.message());
        REQUIRE_THAT(msg, ContainsSubstring("value {} and {}"));
        REQUIRE_THAT(msg, ContainsSubstring("1"));
        REQUIRE_THAT(msg, ContainsSubstring("format error"));
    }

    SECTION("Null C strings render as (null)")
    {
        const char *nothing = nullptr;
        auto rec            = make_record("m", log_level::info, "name:", nothing);
        REQUIRE(rec.message() == "name: (null)");
    }

    SECTION("Message is computed once")
    {
        secret pw{"hunter2"};
        auto rec = make_record("auth", log_level::info, "login", "alice", pw);

        REQUIRE_FALSE(rec.has_message());
        const auto &first = rec.message();
        REQUIRE(first == "login alice *******");

        int calls_after_first = pw.calls->load();
        const auto &second    = rec.message();
        REQUIRE(&first == &second);
        REQUIRE(second == "login alice *******");
        REQUIRE(pw.calls->load() == calls_after_first);
    }
}

TEST_CASE("Redaction", "[record][redaction]")
{
    SECTION("Raw value never appears in message or formatted line")
    {
        auto rec = make_recordf("auth", log_level::info, "password={}", secret{"hunter2"});
        counting_formatter formatter;

        REQUIRE(rec.message() == "password=*******");
        REQUIRE_THAT(rec.formatted(0, formatter), !ContainsSubstring("hunter2"));
        REQUIRE(rec.formatted(0, formatter) == "auth|password=*******");
    }

    SECTION("Redactable argument is swapped for its redacted form")
    {
        auto rec = make_record("auth", log_level::info, secret{"abc"});
        REQUIRE(rec.args().front().is_redactable());

        rec.message();
        REQUIRE_FALSE(rec.args().front().is_redactable());
        REQUIRE(rec.args().front().to_string() == "***");
    }

    SECTION("Redaction is idempotent")
    {
        arg_list args = make_args("user", secret{"topsecret"});
        redact_args(args);
        auto once = join_args(args);
        redact_args(args);
        REQUIRE(join_args(args) == once);
        REQUIRE(once == "user *********");
    }
}

TEST_CASE("Record formatted line", "[record]")
{
    counting_formatter formatter;
    auto rec = make_record("svc", log_level::notice, "hello");

    REQUIRE_FALSE(rec.has_formatted());
    REQUIRE(rec.formatted(3, formatter) == "svc|hello");
    REQUIRE(formatter.last_calldepth == 4);
    REQUIRE(rec.formatted(3, formatter) == "svc|hello");
    REQUIRE(formatter.calls.load() == 1);
}

TEST_CASE("Record snapshot", "[record]")
{
    secret pw{"pw"};
    auto rec = make_record("m", log_level::info, "k", pw);

    SECTION("Snapshot shares argument payloads")
    {
        auto copy = rec.snapshot();
        REQUIRE(copy.id() == rec.id());
        REQUIRE(copy.module() == rec.module());
        REQUIRE(copy.args().size() == rec.args().size());
        for (size_t i = 0; i < copy.args().size(); ++i) { REQUIRE(copy.args()[i].same_payload(rec.args()[i])); }
    }

    SECTION("Caches present at snapshot time are carried over")
    {
        rec.message();
        auto copy = rec.snapshot();
        REQUIRE(copy.has_message());
        REQUIRE(copy.message() == "k **");
    }

    SECTION("Caches are independent after the snapshot")
    {
        auto copy = rec.snapshot();
        counting_formatter formatter;

        copy.formatted(0, formatter);
        REQUIRE(copy.has_formatted());
        REQUIRE_FALSE(rec.has_formatted());
        REQUIRE_FALSE(rec.has_message());
    }

    SECTION("Snapshots can be materialized on different threads")
    {
        rec.message();
        counting_formatter formatter;
        std::vector<record> copies;
        for (int i = 0; i < 4; ++i) copies.push_back(rec.snapshot());

        std::vector<std::thread> workers;
        std::vector<std::string> lines(copies.size());
        for (size_t i = 0; i < copies.size(); ++i)
        {
            workers.emplace_back([&, i]() { lines[i] = copies[i].formatted(0, formatter); });
        }
        for (auto &w : workers) w.join();

        for (const auto &line : lines) REQUIRE(line == "m|k **");
    }
}

TEST_CASE("Record data and clock", "[record]")
{
    log_clock::set(&frozen_now);

    auto rec  = make_record("svc.api", log_level::error, "boom");
    auto data = rec.data();

    REQUIRE(data.id == rec.id());
    REQUIRE(data.time == frozen_now());
    REQUIRE(data.module == "svc.api");
    REQUIRE(data.level == log_level::error);
    REQUIRE(data.message == "boom");
    REQUIRE(rec.has_message());

    log_clock::reset();
    auto later = make_record("svc.api", log_level::error, "boom");
    REQUIRE(later.time() > frozen_now());
}
