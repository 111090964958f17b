/*
 * sniprun - sandboxed snippet execution for interactive tutorials
 * Runs short code samples in throwaway Linux sandboxes and streams the output
 */

#include "api.h"
#include "config.h"
#include "errors.h"
#include "gateway.h"
#include "http_server.h"
#include "log.h"
#include "quota_manager.h"
#include "result_aggregator.h"
#include "runtime_registry.h"
#include "scheduler.h"
#include "worker_pool.h"

#include <signal.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

using namespace sniprun;

namespace {

HttpServer* g_server = nullptr;

void handle_shutdown_signal(int) {
    // Only async-signal-safe work here; closing the socket ends the accept loop
    if (g_server) {
        g_server->stop_accepting();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            std::cout << ServiceConfig::usage(argv[0]);
            return 0;
        }
    }

    ServiceConfig config;
    RuntimeRegistry registry;
    try {
        config = ServiceConfig::from_args(argc, argv);
        registry = config.runtimes_path.empty()
            ? RuntimeRegistry::with_builtins()
            : RuntimeRegistry::from_file(config.runtimes_path);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << ServiceConfig::usage(argv[0]);
        return 2;
    }

    log::set_quiet(config.quiet);
    signal(SIGPIPE, SIG_IGN);

    log::info("Main", "sniprun - sandboxed snippet execution");
    for (Language language : registry.languages()) {
        const RuntimeProfile* profile = registry.find(language);
        log::info("Registry", language_to_string(language) + ": " + profile->command.front() +
                  " (" + std::to_string(profile->memory_limit_bytes / (1024 * 1024)) + " MB, " +
                  std::to_string(profile->wall_clock_limit.count()) + " ms)");
    }

    WorkerPool pool(registry, config.pool);
    ResultAggregator aggregator(config.aggregator);
    Scheduler scheduler(pool, aggregator, config.scheduler);
    QuotaManager quota(config.quota);
    Gateway gateway(registry, quota, scheduler, aggregator, config.gateway);

    try {
        pool.start();
    } catch (const std::exception& e) {
        log::alert("Main", std::string("cannot start worker pool: ") + e.what());
        return 1;
    }
    scheduler.start();

    HttpServer server(config.port, config.max_connections);
    register_routes(server, ApiContext{gateway, scheduler, pool, quota, registry});

    // Periodic housekeeping: uncollected results and idle sessions
    std::atomic<bool> sweeping(true);
    std::mutex sweep_mutex;
    std::condition_variable sweep_cv;
    std::thread sweeper([&] {
        std::unique_lock<std::mutex> lock(sweep_mutex);
        while (sweeping) {
            sweep_cv.wait_for(lock, std::chrono::seconds(config.sweep_interval_seconds));
            if (!sweeping) break;
            aggregator.sweep();
            size_t dropped = quota.cleanup_idle();
            if (dropped > 0) {
                log::info("Quota", "Forgot " + std::to_string(dropped) + " idle sessions");
            }
        }
    });

    g_server = &server;
    struct sigaction action {};
    action.sa_handler = handle_shutdown_signal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    int exit_code = 0;
    try {
        server.start();
    } catch (const std::exception& e) {
        log::alert("Main", e.what());
        exit_code = 1;
    }

    log::info("Main", "Shutting down");
    g_server = nullptr;
    // Every accepted request gets a result before the connections are waited on
    server.stop_accepting();
    scheduler.stop();
    pool.stop();
    server.stop();

    {
        std::lock_guard<std::mutex> lock(sweep_mutex);
        sweeping = false;
    }
    sweep_cv.notify_all();
    sweeper.join();

    return exit_code;
}
