#include <tierlog/log.hpp>

using namespace tierlog;

int main()
{
    logging_context ctx;
    ctx.set_backend(make_stdout_sink());

    auto log = ctx.get_or_create_logger("integration");

    // Test basic logging
    log->info("Integration test successful!");
    log->debug("Debug message");
    log->warning("Warning message");

    // Test format strings and prefixes
    log->infof("User {} logged in from {}", 12345, "192.168.1.1");
    prefix_logger conn(log, "conn#1");
    conn.notice("closed");

    ctx.set_level(log_level::error);
    log->info("Not shown");

    return 0;
}
