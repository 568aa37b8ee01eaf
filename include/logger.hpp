#pragma once

#include <unistd.h>

#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

namespace mgen {
namespace logger {

enum class Level {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

struct LogConfig {
    std::string log_dir = "/tmp/.mgen_log";
    bool use_stdout = false;
    Level min_level = Level::WARNING;
    size_t max_file_size = 10 * 1024 * 1024;  // 10MB
    size_t max_files = 5;
};

// Maps "debug" / "info" / "warning" / "error" to a Level.
// Throws std::invalid_argument for anything else.
inline Level ParseLevel(const std::string& name);

inline const char* LevelName(Level level);

/**
 * @brief Process-wide synchronous logger.
 *
 * Writes either to stdout or to `<log_dir>/<pid>.log`, rotating the file
 * once it grows past `max_file_size`.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    void configure(const LogConfig& config) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = config;
        init();
    }

    Level min_level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_.min_level;
    }

    bool enabled(Level level) const { return level >= min_level(); }

    void log(Level level, const char* file, const char* func, int line, const char* fmt, ...) {
        if (!enabled(level)) return;

        char buffer[512];
        va_list args;
        va_start(args, fmt);
        vsnprintf(buffer, sizeof(buffer), fmt, args);
        va_end(args);

        write_log(format_log(level, file, func, line, buffer));
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() { init(); }

    // Called with mutex_ held (or from the constructor).
    void init() {
        namespace fs = std::filesystem;

        file_stream_.reset();
        if (config_.use_stdout) {
            init_success_ = true;
            return;
        }
        // The file is opened on the first message that passes the level filter.
        init_success_ = false;
        try {
            if (!fs::exists(config_.log_dir)) {
                fs::create_directories(config_.log_dir);
            }
            init_success_ = true;
        } catch (const fs::filesystem_error& e) {
            std::cerr << "mgen logger initialization failed: " << e.what() << std::endl;
        }
    }

    std::filesystem::path get_log_path(size_t index) const {
        auto base_name = std::to_string(getpid()) + ".log";
        if (index == 0) return std::filesystem::path(config_.log_dir) / base_name;
        return std::filesystem::path(config_.log_dir) / (base_name + "." + std::to_string(index));
    }

    void open_log_file() {
        current_log_path_ = get_log_path(0);
        file_stream_ = std::make_unique<std::ofstream>(current_log_path_, std::ios::out | std::ios::app);
        if (!file_stream_->is_open()) {
            init_success_ = false;
            file_stream_.reset();
        }
    }

    void rotate_log_files() {
        namespace fs = std::filesystem;

        file_stream_.reset();
        std::error_code ec;
        for (size_t i = config_.max_files; i-- > 0;) {
            auto old_path = get_log_path(i);
            if (!fs::exists(old_path, ec)) continue;
            if (i + 1 >= config_.max_files) {
                fs::remove(old_path, ec);
            } else {
                fs::rename(old_path, get_log_path(i + 1), ec);
            }
        }
        open_log_file();
    }

    std::string format_log(Level level, const char* file, const char* func, int line,
                           const std::string& message) const {
        auto now = std::chrono::system_clock::now();
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        char time_str[20];
        std::strftime(time_str, sizeof(time_str), "%Y%m%d%H%M%S", std::localtime(&t));

        std::ostringstream oss;
        oss << "[" << time_str << "] "
            << "[" << LevelName(level) << "] "
            << "[" << getpid() << "] "
            << "[" << std::filesystem::path(file).filename().string() << ":" << func << ":" << line << "] "
            << message << "\n";
        return oss.str();
    }

    void write_log(const std::string& log_entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!init_success_) return;

        if (config_.use_stdout) {
            std::cout << log_entry << std::flush;
            return;
        }

        if (!file_stream_) {
            open_log_file();
            if (!file_stream_) return;
        }
        *file_stream_ << log_entry;
        file_stream_->flush();

        std::error_code ec;
        if (std::filesystem::file_size(current_log_path_, ec) >= config_.max_file_size && !ec) {
            rotate_log_files();
        }
    }

    LogConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    bool init_success_ = false;
    mutable std::mutex mutex_;
    std::filesystem::path current_log_path_;
};

inline Level ParseLevel(const std::string& name) {
    if (name == "debug") return Level::DEBUG;
    if (name == "info") return Level::INFO;
    if (name == "warning") return Level::WARNING;
    if (name == "error") return Level::ERROR;
    throw std::invalid_argument("Unknown log level: " + name);
}

inline const char* LevelName(Level level) {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO: return "INFO";
        case Level::WARNING: return "WARNING";
        case Level::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

} // namespace logger
} // namespace mgen

// Arguments are only evaluated when the level passes the filter.
#define MGEN_LOG_AT(level, fmt, ...)                                                           \
    do {                                                                                       \
        auto& mgen_logger_ = mgen::logger::Logger::instance();                                 \
        if (mgen_logger_.enabled(level)) {                                                     \
            mgen_logger_.log(level, __FILE__, __FUNCTION__, __LINE__, fmt, ## __VA_ARGS__);    \
        }                                                                                      \
    } while (0)

#define MGEN_LOG_DEBUG(fmt, ...) MGEN_LOG_AT(mgen::logger::Level::DEBUG, fmt, ## __VA_ARGS__)

#define MGEN_LOG_INFO(fmt, ...) MGEN_LOG_AT(mgen::logger::Level::INFO, fmt, ## __VA_ARGS__)

#define MGEN_LOG_WARNING(fmt, ...) MGEN_LOG_AT(mgen::logger::Level::WARNING, fmt, ## __VA_ARGS__)

#define MGEN_LOG_ERROR(fmt, ...) MGEN_LOG_AT(mgen::logger::Level::ERROR, fmt, ## __VA_ARGS__)
