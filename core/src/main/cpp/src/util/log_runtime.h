/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include "log.h"
#include "logmanager.h"
#include <memory>
#include <mutex>

namespace ropelist {

/**
 * RAII manager for the entire logging subsystem.
 * Ensures proper initialization and teardown of all logging components.
 *
 * Usage:
 *   - Tests: Create in SetUpTestSuite(), destroy in TearDownTestSuite()
 *   - Production: Create at startup, destroy at shutdown
 *   - Singleton pattern available via getInstance()
 */
class LogRuntime {
public:
    struct Config {
        // Logging output
        bool enable_file_logging;
        std::string log_dir;  // Empty = use default from environment
        bool append;

        // Initial log level
        LogLevel initial_level;

        Config()
            : enable_file_logging(false)
            , append(true)
            , initial_level(LOG_WARNING) {}

        /**
         * Read configuration from environment
         */
        static Config fromEnv() {
            Config config;

            if (const char* enable = std::getenv("ROPELIST_LOG_ENABLE_FILE")) {
                config.enable_file_logging = (std::string(enable) != "0");
            }

            if (const char* dir = std::getenv("ROPELIST_LOG_DIR")) {
                config.log_dir = dir;
            }

            if (const char* level = std::getenv("LOG_LEVEL")) {
                if (!parseLogLevel(level, config.initial_level))
                    std::cerr << "Warning: Invalid LOG_LEVEL '" << level << "', keeping WARNING\n";
            }

            return config;
        }
    };

    /**
     * Create a LogRuntime with the given configuration
     */
    explicit LogRuntime(const Config& config = Config())
        : config_(config), log_manager_(nullptr) {

        logLevel.store(config_.initial_level, std::memory_order_relaxed);

        if (config_.enable_file_logging) {
            log_manager_ = std::make_unique<LogManager>(config_.log_dir, config_.append);
        }
    }

    ~LogRuntime() {
        shutdown();
    }

    /**
     * Explicitly shutdown all logging components
     * Safe to call multiple times
     */
    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);

        // Reset logger to stderr before destroying LogManager
        Logger::setLogFile(nullptr);
        log_manager_.reset();
    }

    /**
     * Path of the active log file, empty when logging to stderr
     */
    std::string logPath() const {
        return log_manager_ ? log_manager_->path() : std::string();
    }

    /**
     * Global singleton instance, configured from the environment
     */
    static LogRuntime* getInstance() {
        static std::unique_ptr<LogRuntime> instance;
        static std::once_flag init_flag;

        std::call_once(init_flag, []() {
            instance = std::make_unique<LogRuntime>(Config::fromEnv());
        });

        return instance.get();
    }

    LogRuntime(const LogRuntime&) = delete;
    LogRuntime& operator=(const LogRuntime&) = delete;

private:
    Config config_;
    std::unique_ptr<LogManager> log_manager_;
    std::mutex mutex_;
};

/**
 * Test helper: RAII guard for tests
 */
class LogRuntimeGuard {
public:
    explicit LogRuntimeGuard(const LogRuntime::Config& config = LogRuntime::Config())
        : original_level_(logLevel.load(std::memory_order_relaxed)),  // Save BEFORE construction
          runtime_(std::make_unique<LogRuntime>(config)) {
    }

    ~LogRuntimeGuard() {
        runtime_->shutdown();

        // Restore original log level
        logLevel.store(original_level_, std::memory_order_relaxed);
    }

    LogRuntime* operator->() { return runtime_.get(); }
    LogRuntime& operator*() { return *runtime_; }

private:
    int original_level_;
    std::unique_ptr<LogRuntime> runtime_;
};

} // namespace ropelist
