#include "Config.hpp"
#include "DriverFactory.hpp"
#include "MigrationRunner.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <thread>
#include <vector>

using namespace sqlbridge;

namespace {

volatile std::sig_atomic_t g_signal_received = 0;

void signalHandler(int signal) {
    g_signal_received = signal;
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

void setupLogging(bool debug, const std::string& logFile) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
        sinks.push_back(console_sink);

        if (!logFile.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
                file_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << logFile << ": " << ex.what() << std::endl;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("sqlbridge", sinks.begin(), sinks.end());
        logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

// Cancels the root context once a signal arrived; Context::cancel is not
// async-signal-safe, so the handler only records the signal
class SignalWatcher {
public:
    explicit SignalWatcher(ContextPtr root)
        : m_thread([this, root]() {
              while (!m_stop.load()) {
                  int signal = g_signal_received;
                  if (signal != 0) {
                      spdlog::warn("Received signal {}, cancelling migration", signal);
                      root->cancel();
                      return;
                  }
                  std::this_thread::sleep_for(std::chrono::milliseconds(100));
              }
          }) {}

    ~SignalWatcher() {
        m_stop = true;
        m_thread.join();
    }

private:
    std::atomic<bool> m_stop{false};
    std::thread m_thread;
};

void printSummary(const MigrationResult& result) {
    std::cout << "\nMigration " << toString(result.state) << "\n";
    std::cout << "  " << std::left << std::setw(30) << "table" << " " << std::setw(10) << "state"
              << std::right << std::setw(10) << "rows" << std::setw(10) << "batches"
              << std::setw(10) << "offset" << "\n";
    for (const auto& table : result.tables) {
        std::cout << "  " << std::left << std::setw(30) << table.table << " "
                  << std::setw(10) << toString(table.state) << std::right
                  << std::setw(10) << table.rowsTransferred
                  << std::setw(10) << table.batchesCommitted
                  << std::setw(10) << table.committedOffset << "\n";
    }
    if (result.error) {
        std::cout << "  error: " << result.error->what() << "\n";
    }
    std::cout << std::flush;
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config = Config::parseArgs(argc, argv);

    setupLogging(config.debug, config.log_file);

    if (!config.validate()) {
        return 2;
    }

    setupSignalHandlers();
    auto root = Context::background();

    MigrationJob job;
    job.tables = config.tables;
    job.batchSize = config.migration.batch_size;
    job.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config.migration.timeout);
    job.maxAttempts = config.migration.retry_attempts;
    job.workers = config.migration.workers;
    job.retryBackoff = config.migration.retry_backoff;

    // Persist after every batch so a killed run resumes where it stopped
    if (!config.state_file.empty()) {
        const auto stateFile = config.state_file;
        job.onCommit = [stateFile](const CursorMap& cursors) {
            try {
                MigrationStateFile::save(stateFile, cursors);
            } catch (const std::exception& e) {
                spdlog::warn("Failed to save migration state: {}", e.what());
            }
        };
    }

    if (config.resume) {
        try {
            job.cursors = MigrationStateFile::load(config.state_file);
        } catch (const std::exception& e) {
            spdlog::error("Cannot resume: {}", e.what());
            return 2;
        }
    }

    std::unique_ptr<Driver> source;
    std::unique_ptr<Driver> target;
    try {
        source = connectDriver(config.current);
        target = connectDriver(config.target);

        if (config.init_schema) {
            target->initializeSchema();
        }
    } catch (const DatabaseError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    job.source = source.get();
    job.target = target.get();

    MigrationResult result;
    {
        SignalWatcher watcher(root);
        MigrationRunner runner(root);
        result = runner.run(job);
    }

    if (!config.state_file.empty()) {
        try {
            MigrationStateFile::save(config.state_file, job.cursors);
        } catch (const std::exception& e) {
            spdlog::error("Failed to save migration state: {}", e.what());
        }
    }

    target->close();
    source->close();

    printSummary(result);
    return result.completed() ? 0 : 1;
}
