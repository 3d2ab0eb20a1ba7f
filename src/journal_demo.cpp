/**
 * @file journal_demo.cpp
 * @brief Writes a burst of records to the journal and reports how long queuing them took
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include "journal.hpp"

using namespace sjournal;

void print_usage(const char *prog_name)
{
    fmt::print(stderr,
               "Usage: {} [options]\n"
               "Options:\n"
               "  -n <entries>      Number of entries (default: 100)\n"
               "  -s <socket>       Journal socket (default: $SJOURNAL_SOCKET or {})\n"
               "  -d                Enable debug records\n"
               "  -h                Show this help\n",
               prog_name,
               DEFAULT_SOCKET_PATH);
}

static void run_test(journal_client &journal, int entries)
{
    auto start = std::chrono::steady_clock::now();

    for (int i = 0; i < entries; i++) { journal.info("log entry #%d", i); }

    auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start);
    fmt::print(stderr, "[{}ns]\n", elapsed.count());
}

int main(int argc, char *argv[])
{
    auto options = client_options::from_env();
    int entries  = 100;

    for (int i = 1; i < argc; i++)
    {
        if (strcmp(argv[i], "-n") == 0 && i + 1 < argc) { entries = std::atoi(argv[++i]); }
        else if (strcmp(argv[i], "-s") == 0 && i + 1 < argc) { options.socket_path = argv[++i]; }
        else if (strcmp(argv[i], "-d") == 0) { options.debug = true; }
        else if (strcmp(argv[i], "-h") == 0)
        {
            print_usage(argv[0]);
            return 0;
        }
        else
        {
            fmt::print(stderr, "Unknown option: {}\n", argv[i]);
            print_usage(argv[0]);
            return 1;
        }
    }

    if (entries < 0)
    {
        fmt::print(stderr, "Error: entries must not be negative\n");
        return 1;
    }

    try
    {
        journal_client journal(options);

        journal.add_variable("FOO", "bar");
        journal.info("starting");
        journal.debug("debug records enabled");

        run_test(journal, entries);
        journal.flush();

        auto stats = journal.stats();
        fmt::print(stderr,
                   "written: {}, failed: {}, max queue depth: {}/{}\n",
                   stats.records_written,
                   stats.write_failures,
                   stats.max_queue_depth,
                   stats.capacity);
    }
    catch (const connection_error &e)
    {
        fmt::print(stderr, "{}\n", e.what());
        return 1;
    }

    return 0;
}
