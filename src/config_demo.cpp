/**
 * @file config_demo.cpp
 * @brief Configure tierlog from the command line and log a burst of records
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <thread>
#include <vector>

#include "tierlog/log.hpp"

using namespace tierlog;
using namespace std::chrono_literals;

void print_usage(const char *prog_name)
{
    std::cerr << "Usage: " << prog_name << " [options]\n"
              << "Options:\n"
              << "  -l <levels>       Level string, e.g. \"info,svc.api=warning\" (default: debug)\n"
              << "  -m <module>       Module that gets the destinations below (default: svc)\n"
              << "  -f <file>         Add a file destination (default: /tmp/tierlog.txt)\n"
              << "  -u <url>          Add an http destination\n"
              << "  -s                Write the files synchronously\n"
              << "  -n <count>        Records per thread (default: 1000)\n"
              << "  -t <threads>      Logging threads (default: 4)\n"
              << "  -h                Show this help\n";
}

int main(int argc, char *argv[])
{
    std::string levels = "debug";
    module_config module{"svc", "debug", {}};
    bool sync_files = false;
    int count       = 1000;
    int threads     = 4;

    for (int i = 1; i < argc; i++)
    {
        if (strcmp(argv[i], "-l") == 0 && i + 1 < argc) { levels = argv[++i]; }
        else if (strcmp(argv[i], "-m") == 0 && i + 1 < argc) { module.name = argv[++i]; }
        else if (strcmp(argv[i], "-f") == 0 && i + 1 < argc) { module.destinations.push_back({argv[++i], {}}); }
        else if (strcmp(argv[i], "-u") == 0 && i + 1 < argc)
        {
            module.destinations.push_back({argv[++i], {{"timeout", "1"}}});
        }
        else if (strcmp(argv[i], "-s") == 0) { sync_files = true; }
        else if (strcmp(argv[i], "-n") == 0 && i + 1 < argc) { count = std::atoi(argv[++i]); }
        else if (strcmp(argv[i], "-t") == 0 && i + 1 < argc) { threads = std::atoi(argv[++i]); }
        else if (strcmp(argv[i], "-h") == 0)
        {
            print_usage(argv[0]);
            return 0;
        }
        else
        {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (module.destinations.empty()) module.destinations.push_back({"/tmp/tierlog.txt", {}});
    if (sync_files)
    {
        for (auto &dest : module.destinations) dest.options["async"] = "false";
    }

    logging_context ctx;

    logging_config cfg;
    cfg.modules.push_back(module);
    apply(cfg, ctx);

    if (!configure_levels(*ctx.default_backend(), levels))
    {
        std::cerr << "Error: invalid level string: " << levels << "\n";
        return 1;
    }

    auto log = ctx.get_or_create_logger(module.name);
    log->noticef("Starting log burst: {} threads x {} records", threads, count);

    auto start = std::chrono::steady_clock::now();
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t)
    {
        workers.emplace_back(
            [&, t]()
            {
                prefix_logger worker(log, "worker#" + std::to_string(t));
                for (int i = 0; i < count; ++i) { worker.infof("iteration {} of {}", i, count); }
            });
    }
    for (auto &w : workers) w.join();
    auto elapsed = std::chrono::steady_clock::now() - start;

    ctx.tasks()->wait_idle(10s);

    auto total = static_cast<double>(threads) * count;
    auto ms    = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    log->noticef("Logged {} records in {}ms ({:.0f} records/s)", static_cast<long>(total), ms,
                 ms > 0 ? total * 1000.0 / static_cast<double>(ms) : total);

    return 0;
}
