/**
 * @file cloudsyncd.cpp
 * @brief Sync daemon: runs the orchestrator until SIGINT/SIGTERM
 *
 * HOW IT WORKS:
 * 1. Configuration: JSON file (-c), then environment, then flags
 * 2. Logging: coloured console sink, optional rotating file sink
 * 3. N threads run the io_context (timers, pipes, DNS probes)
 * 4. On a signal the main thread runs Orchestrator::shutdown() while
 *    the io threads keep delivering process exits, then stops them
 *
 * Run with:
 *   ./build/cloudsyncd -c /etc/cloudsync.json -l debug
 */

#include "cloudsync/core/config.hpp"
#include "cloudsync/events/components.hpp"
#include "cloudsync/events/event_bus.hpp"
#include "cloudsync/process/posix_launcher.hpp"
#include "cloudsync/sync/orchestrator.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <future>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace asio = boost::asio;
using namespace cloudsync;

namespace {

constexpr std::size_t kLogFileMaxSize = 10 * 1024 * 1024;
constexpr std::size_t kLogFileCount = 3;

struct Options {
    std::optional<std::string> config_path;
    std::optional<std::string> data_dir;
    std::optional<std::string> log_level;
    std::optional<std::string> trigger_policy;
    unsigned threads = 2;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  -c, --config <file>      JSON configuration file\n"
              << "  -d, --data <dir>         data directory (jobs, activity, analytics)\n"
              << "  -l, --log-level <level>  trace|debug|info|warn|error\n"
              << "  -p, --policy <policy>    interval|interval_or_diff\n"
              << "      --threads <n>        io threads (default 2)\n"
              << "  -h, --help               show this help\n";
}

std::optional<Options> parse_args(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(EXIT_SUCCESS);
        } else if (arg == "-c" || arg == "--config") {
            if (!(options.config_path = next())) return std::nullopt;
        } else if (arg == "-d" || arg == "--data") {
            if (!(options.data_dir = next())) return std::nullopt;
        } else if (arg == "-l" || arg == "--log-level") {
            if (!(options.log_level = next())) return std::nullopt;
        } else if (arg == "-p" || arg == "--policy") {
            if (!(options.trigger_policy = next())) return std::nullopt;
        } else if (arg == "--threads") {
            auto value = next();
            if (!value) return std::nullopt;
            int threads = std::atoi(value->c_str());
            if (threads < 1) {
                std::cerr << "--threads must be at least 1\n";
                return std::nullopt;
            }
            options.threads = static_cast<unsigned>(threads);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return std::nullopt;
        }
    }
    return options;
}

Result<Config> build_config(const Options& options) {
    Config config;
    if (options.config_path) {
        auto loaded = Config::load(*options.config_path);
        if (loaded.is_error()) {
            return loaded;
        }
        config = loaded.value();
    }

    auto env = config.apply_environment();
    if (env.is_error()) {
        return Err<Config>(env.error());
    }

    if (options.data_dir) config.data_dir = *options.data_dir;
    if (options.log_level) config.log_level = *options.log_level;
    if (options.trigger_policy) {
        auto policy = parse_trigger_policy(*options.trigger_policy);
        if (policy.is_error()) {
            return Err<Config>(policy.error());
        }
        config.trigger_policy = policy.value();
    }

    auto valid = config.validate();
    if (valid.is_error()) {
        return Err<Config>(valid.error());
    }
    return Ok(config);
}

std::shared_ptr<spdlog::logger> make_logger(const Config& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!config.log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file.string(), kLogFileMaxSize, kLogFileCount));
    }

    auto logger = std::make_shared<spdlog::logger>("cloudsync", sinks.begin(), sinks.end());
    logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    logger->set_level(spdlog::level::from_str(config.log_level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    return logger;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto options = parse_args(argc, argv);
    if (!options) {
        return EXIT_FAILURE;
    }

    auto config = build_config(*options);
    if (config.is_error()) {
        spdlog::error("Invalid configuration ({}): {}",
                      error_code_name(config.error().code), config.error().message);
        return EXIT_FAILURE;
    }

    std::shared_ptr<spdlog::logger> logger;
    try {
        logger = make_logger(config.value());
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::error("Failed to open log file {}: {}", config.value().log_file.string(), e.what());
        return EXIT_FAILURE;
    }

    logger->info("════════════════════════════════════════════");
    logger->info("cloudsyncd starting");
    logger->info("Data directory: {}", config.value().data_dir.string());
    logger->info("Transfer tool:  {}", config.value().rclone.binary);
    logger->info("════════════════════════════════════════════");

    // A child killed by SIGPIPE on our side must not take the daemon down
    std::signal(SIGPIPE, SIG_IGN);

    asio::io_context io_context;
    auto work = asio::make_work_guard(io_context);

    events::EventBus bus(logger);
    events::LoggerComponent log_mirror(bus, logger);
    process::PosixProcessLauncher launcher(io_context, logger);
    sync::Orchestrator orchestrator(io_context, config.value(), bus, launcher, logger);

    std::promise<int> stop_signal;
    auto stopped = stop_signal.get_future();
    asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&stop_signal](boost::system::error_code ec, int signal_number) {
        if (!ec) {
            stop_signal.set_value(signal_number);
        }
    });

    std::vector<std::thread> threads;
    threads.reserve(options->threads);
    for (unsigned i = 0; i < options->threads; ++i) {
        threads.emplace_back([&io_context]() { io_context.run(); });
    }

    orchestrator.start();

    int signal_number = stopped.get();
    logger->info("Received signal {}, shutting down...", signal_number);

    orchestrator.shutdown();

    work.reset();
    io_context.stop();
    for (auto& thread : threads) {
        thread.join();
    }

    logger->info("cloudsyncd stopped");
    spdlog::shutdown();
    return EXIT_SUCCESS;
}
