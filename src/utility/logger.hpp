#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace gridbreak {

/**
 * Thread-safe logging for DEBUG builds only.
 * Release builds compile every LOG_* call away, arguments included.
 *
 * Messages take fmt format strings:
 *   LOG_INFO("built {} bricks on a {}x{} grid", n, cols, rows);
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
        static std::mutex log_mutex;
        std::lock_guard<std::mutex> lock(log_mutex);

        const auto now = std::chrono::system_clock::now();
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()) %
                        1000;
        const std::time_t time = std::chrono::system_clock::to_time_t(now);

        const size_t last_slash = file.find_last_of("/\\");
        if (last_slash != std::string_view::npos) {
            file.remove_prefix(last_slash + 1);
        }

        fmt::print(stderr, "[{}][{:%H:%M:%S}.{:03}][{}:{}] {}\n",
                   level_to_string(level), fmt::localtime(time), ms.count(),
                   file, line, message);
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

} // namespace gridbreak

#ifdef DEBUG
#define GRIDBREAK_LOG(level, ...)                                              \
    gridbreak::Logger::log(gridbreak::Logger::level, __FILE__, __LINE__,       \
                           fmt::format(__VA_ARGS__))
#define LOG_DEBUG(...) GRIDBREAK_LOG(DEBUG_LEVEL, __VA_ARGS__)
#define LOG_INFO(...) GRIDBREAK_LOG(INFO_LEVEL, __VA_ARGS__)
#define LOG_WARN(...) GRIDBREAK_LOG(WARN_LEVEL, __VA_ARGS__)
#define LOG_ERROR(...) GRIDBREAK_LOG(ERROR_LEVEL, __VA_ARGS__)
#else
#define LOG_DEBUG(...)                                                         \
    do {                                                                       \
    } while (0)
#define LOG_INFO(...)                                                          \
    do {                                                                       \
    } while (0)
#define LOG_WARN(...)                                                          \
    do {                                                                       \
    } while (0)
#define LOG_ERROR(...)                                                         \
    do {                                                                       \
    } while (0)
#endif
