#pragma once

#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Thread-safe singleton logger class.
 *
 * This class provides a single point of access to the logger instance
 * throughout the simulator, so that messages from the setup code, the
 * backend worker threads and the command line tool all go to the same
 * console sink through one asynchronous queue.
 */
class BraggSimLogger {
  public:
    /**
     * @brief Retrieves the singleton instance of the logger.
     *
     * The logger is created on the first call and the same instance is
     * returned on subsequent calls.
     *
     * @return std::shared_ptr<spdlog::logger>& A shared pointer to the logger instance.
     */
    static std::shared_ptr<spdlog::logger>& getInstance() {
        static std::shared_ptr<spdlog::logger> instance = createLogger();
        return instance;
    }

    /**
     * @brief Sets the logging level dynamically at runtime.
     *
     * @param level The desired logging level (e.g., spdlog::level::info, spdlog::level::debug).
     */
    static void setLevel(spdlog::level::level_enum level) {
        getInstance()->set_level(level);
    }

  private:
    BraggSimLogger() = default;

    /**
     * @brief Creates and configures the logger instance.
     *
     * Initializes a colored console sink behind an asynchronous logger.
     * The level is read from the LOG_LEVEL environment variable if set.
     *
     * @return std::shared_ptr<spdlog::logger> The configured logger instance.
     */
    static std::shared_ptr<spdlog::logger> createLogger() {
        try {
            // Queue size for async messages
            size_t queue_size = 8192;

            // Initialize spdlog asynchronous mode with a background worker thread
            spdlog::init_thread_pool(queue_size, 1);

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [thread %t] [%^%l%$] %v");

            std::vector<spdlog::sink_ptr> sinks{console_sink};
            auto async_logger = std::make_shared<spdlog::async_logger>(
              "BraggSimLogger",
              sinks.begin(),
              sinks.end(),
              spdlog::thread_pool(),
              spdlog::async_overflow_policy::block  // Block if queue is full
            );

            const char* logLevelEnv = std::getenv("LOG_LEVEL");
            if (logLevelEnv) {
                async_logger->set_level(spdlog::level::from_str(logLevelEnv));
            } else {
                async_logger->set_level(spdlog::level::info);
            }

            spdlog::register_logger(async_logger);

            return async_logger;
        } catch (const spdlog::spdlog_ex& ex) {
            throw std::runtime_error(std::string("Logger initialization failed: ")
                                     + ex.what());
        }
    }
};

/// Global handle to the shared logger
inline spdlog::logger& logger = *BraggSimLogger::getInstance();
