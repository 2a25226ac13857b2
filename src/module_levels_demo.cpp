/**
 * @file module_levels_demo.cpp
 * @brief Demonstration of hierarchical module levels and fan-out
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include "tierlog/log.hpp"
#include <iostream>

using namespace tierlog;
using namespace std::chrono_literals;

int main()
{
    logging_context ctx;

    // 1. Console for everything, plus one file for the whole application
    auto app_file = ctx.files().acquire("application.log", file_options{.async = true}, ctx.services());
    ctx.set_backend({make_stderr_sink(), app_file});

    // 2. Quiet by default, chatty where we are debugging
    configure_levels(*ctx.default_backend(), "info, network=warning, network.http=debug, database.sql=error");

    // 3. Payments get their own JSON file on top of the default backend
    auto payments_backend = std::make_shared<module_level_backend>(
        std::make_shared<multi_sink>(std::vector<std::shared_ptr<log_sink>>{
            ctx.files().acquire("payment.json", file_options{.async = false}, ctx.services(make_json_formatter())),
            ctx.default_backend_proxy()}),
        "module:payment");
    payments_backend->set_level(log_level::notice, "payment");
    auto payment = ctx.bind_logger("payment", payments_backend);

    auto app      = ctx.get_or_create_logger("app");
    auto network  = ctx.get_or_create_logger("network");
    auto http     = ctx.get_or_create_logger("network.http");
    auto tcp      = ctx.get_or_create_logger("network.tcp");
    auto database = ctx.get_or_create_logger("database");
    auto sql      = ctx.get_or_create_logger("database.sql");

    app->info("Application starting...");
    network->debug("Initializing network stack");       // below network=warning
    database->infof("Connecting to database at {}:{}", "localhost", 5432);

    http->debug("Starting HTTP server on port", 8080);  // network.http=debug wins
    tcp->info("Accept queue created");                  // inherits network=warning

    network->warningf("High latency detected: {}ms", 250);
    sql->info("SELECT * FROM users WHERE id = ?");      // below database.sql=error
    database->error("Connection pool exhausted!");

    payment->info("Card tokenized");                    // below payment=notice
    payment->noticef("Charge {} accepted", "tx-8812");

    prefix_logger request(app, "req#12345");
    request.info("processing");
    request.warningf("slow handler: {}ms", 840);

    ctx.tasks()->wait_idle(1s);

    std::cout << "\n=== Module Levels Demo Complete ===\n";
    std::cout << "Check the following log files:\n";
    std::cout << "  - application.log: everything that passed the default backend levels\n";
    std::cout << "  - payment.json: payment records at NOTICE and above, as JSON\n\n";

    return 0;
}
