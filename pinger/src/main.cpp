#include "config.hpp"
#include "http_client.hpp"
#include "reporter.hpp"
#include "service.hpp"
#include "url_loader.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

// Signal number of the first SIGINT/SIGTERM, 0 until one arrives
static std::atomic<int> pending_signal{0};

void signal_handler(int signum) {
    int expected = 0;
    pending_signal.compare_exchange_strong(expected, signum);
}

int main(int argc, char** argv) {
    try {
        // 1. Load configuration
        Config config = Config::from_args(argc, argv);
        if (config.show_help) {
            std::cout << Config::usage(argv[0]);
            return 0;
        }

        // 2. Setup logging
        util::setup_logging(config.service_name, config.log_level);
        config.validate();
        spdlog::debug("Log level set to '{}'", config.log_level);

        // 3. Load targets
        auto urls = load_urls(config.urls_file);
        if (urls.empty()) {
            spdlog::critical("No urls provided in {}", config.urls_file);
            return 1;
        }

        // 4. Register signal handlers for graceful shutdown
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        HttpClient http_client(config.user_agent);
        Reporter reporter(std::cout, config.json_output);
        Service service(config, http_client, [&reporter](const ProbeResult& result) {
            reporter.on_result(result);
        });

        // The handler only records the signal; cancellation happens here
        std::atomic<bool> finished{false};
        std::thread signal_watcher([&]() {
            while (!finished) {
                int signum = pending_signal.load();
                if (signum != 0) {
                    spdlog::warn("Received interrupt (signal {}), shutting down...", signum);
                    service.stop(fmt::format("interrupted by signal {}", signum));
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        });

        // 5. Run and report
        RunSummary summary;
        try {
            summary = service.run(urls);
        } catch (const std::exception&) {
            finished = true;
            signal_watcher.join();
            throw;
        }
        finished = true;
        signal_watcher.join();

        reporter.print_summary(summary.stats, summary.runtime);

    } catch (const std::invalid_argument& e) {
        spdlog::critical("{}", e.what());
        std::cerr << Config::usage(argc > 0 ? argv[0] : "pinger");
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred: {}", e.what());
        return 1;
    }

    spdlog::info("Pinger has shut down gracefully.");
    return 0;
}
