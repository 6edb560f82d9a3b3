#pragma once

#include <chrono>
#include <ctime>
#include <mutex>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace halo {

/**
 * Thread-safe logging to stderr, compiled in for DEBUG builds only.
 * Pointer monitors log from their own threads, hence the lock.
 */
class Logger {
  public:
    enum Level {
        DEBUG_LEVEL = 0,
        INFO_LEVEL = 1,
        WARN_LEVEL = 2,
        ERROR_LEVEL = 3
    };

    static void log(Level level, std::string_view file, int line,
                    std::string_view message) {
#ifdef DEBUG
        static std::mutex log_mutex;
        std::lock_guard<std::mutex> lock(log_mutex);

        const auto now = std::chrono::system_clock::now();
        const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()) %
                        1000;
        const std::tm local = *std::localtime(&seconds);

        const size_t last_slash = file.find_last_of("/\\");
        if (last_slash != std::string_view::npos)
            file.remove_prefix(last_slash + 1);

        fmt::print(stderr, "[{}][{:02}:{:02}:{:02}.{:03}][{}:{}] {}\n",
                   level_to_string(level), local.tm_hour, local.tm_min,
                   local.tm_sec, static_cast<int>(ms.count()), file, line,
                   message);
#else
        (void)level;
        (void)file;
        (void)line;
        (void)message;
#endif
    }

  private:
    static const char *level_to_string(Level level) {
        switch (level) {
        case DEBUG_LEVEL:
            return "DEBUG";
        case INFO_LEVEL:
            return "INFO ";
        case WARN_LEVEL:
            return "WARN ";
        case ERROR_LEVEL:
            return "ERROR";
        default:
            return "UNKNOWN";
        }
    }
};

} // namespace halo

// Logging macros - compile to nothing in release builds
#ifdef DEBUG
#define LOG_DEBUG(msg)                                                         \
    halo::Logger::log(halo::Logger::DEBUG_LEVEL, __FILE__, __LINE__, msg)
#define LOG_INFO(msg)                                                          \
    halo::Logger::log(halo::Logger::INFO_LEVEL, __FILE__, __LINE__, msg)
#define LOG_WARN(msg)                                                          \
    halo::Logger::log(halo::Logger::WARN_LEVEL, __FILE__, __LINE__, msg)
#define LOG_ERROR(msg)                                                         \
    halo::Logger::log(halo::Logger::ERROR_LEVEL, __FILE__, __LINE__, msg)
#else
#define LOG_DEBUG(msg)                                                         \
    do {                                                                       \
    } while (0)
#define LOG_INFO(msg)                                                          \
    do {                                                                       \
    } while (0)
#define LOG_WARN(msg)                                                          \
    do {                                                                       \
    } while (0)
#define LOG_ERROR(msg)                                                         \
    do {                                                                       \
    } while (0)
#endif
