#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

// OS-specific headers for color support
#ifdef _WIN32
    #include <windows.h>
#endif

namespace lattice::logging {

// ANSI color codes for terminal output
struct TerminalColors {
    static constexpr const char* RESET   = "\033[0m";
    static constexpr const char* RED     = "\033[31m";
    static constexpr const char* GREEN   = "\033[32m";
    static constexpr const char* YELLOW  = "\033[33m";
    static constexpr const char* BLUE    = "\033[34m";
    static constexpr const char* MAGENTA = "\033[35m";
    static constexpr const char* CYAN    = "\033[36m";
    static constexpr const char* WHITE   = "\033[37m";
    static constexpr const char* BOLD    = "\033[1m";

    // Enable Windows console color support
    static void setupConsole() {
#ifdef _WIN32
        HANDLE hOut   = GetStdHandle(STD_OUTPUT_HANDLE);
        DWORD  dwMode = 0;
        GetConsoleMode(hOut, &dwMode);
        dwMode |= 0x0004; // ENABLE_VIRTUAL_TERMINAL_PROCESSING
        SetConsoleMode(hOut, dwMode);
#endif
    }
};

// Logging levels
enum class LogLevel {
    None,  // No logging
    Error, // Only errors
    Warn,  // Warnings and errors
    Info,  // General information plus warnings and errors
    Debug, // Detailed debug information
    Trace  // Most verbose level
};

class Logger {
public:
    // Initialize logger. Calling init again replaces the sinks.
    static void init(LogLevel           level          = LogLevel::Info,
                     bool               enable_console = true,
                     const std::string& log_file       = "") {
        {
            std::lock_guard<std::mutex> lock(instance().mutex_);
            instance().level_.store(level);
            instance().enable_console_ = enable_console;

            if (enable_console) {
                TerminalColors::setupConsole();
            }

            if (instance().log_file_.is_open()) {
                instance().log_file_.close();
            }
            instance().enable_file_ = false;
            if (!log_file.empty()) {
                instance().log_file_.open(log_file, std::ios::out | std::ios::app);
                instance().enable_file_ = instance().log_file_.is_open();
            }
        }

        if (enable_console || instance().enable_file_) {
            log(LogLevel::Info, "Logging system initialized: level=", levelToString(level));
        }
    }

    static void setLevel(LogLevel level) {
        instance().level_.store(level);
        log(LogLevel::Info, "Log level changed to ", levelToString(level));
    }

    [[nodiscard]] static LogLevel level() {
        return instance().level_.load();
    }

    // Enable/disable reporting of the addressing path chosen for each view
    static void enableFastPathLogging(bool enable) {
        instance().fast_path_logging_enabled_.store(enable);
        log(LogLevel::Info, "Fast-path logging ", enable ? "enabled" : "disabled");
    }

    [[nodiscard]] static bool fastPathLoggingEnabled() {
        return instance().fast_path_logging_enabled_.load() && level() >= LogLevel::Info;
    }

    template <typename... Args>
    static void logFastPath(const std::string& component,
                            const std::string& path,
                            const Args&... details) {
        if (!fastPathLoggingEnabled()) {
            return;
        }

        std::stringstream ss;
        ss << TerminalColors::MAGENTA << TerminalColors::BOLD << "[FASTPATH]"
           << TerminalColors::RESET << " ";
        ss << TerminalColors::CYAN << component << TerminalColors::RESET << ": ";
        ss << TerminalColors::GREEN << TerminalColors::BOLD << path << TerminalColors::RESET;

        if constexpr (sizeof...(Args) > 0) {
            ss << " - ";
            (ss << ... << details);
        }

        log(LogLevel::Info, ss.str());
    }

    static void logPerformance(const std::string& operation,
                               double             time_ms,
                               const std::string& details = "") {
        if (level() < LogLevel::Debug) {
            return;
        }

        std::stringstream ss;
        ss << TerminalColors::BLUE << TerminalColors::BOLD << "[PERFORMANCE]"
           << TerminalColors::RESET << " ";
        ss << TerminalColors::CYAN << operation << TerminalColors::RESET << ": ";
        ss << TerminalColors::YELLOW << std::fixed << std::setprecision(3) << time_ms << " ms"
           << TerminalColors::RESET;

        if (!details.empty()) {
            ss << " - " << details;
        }

        log(LogLevel::Debug, ss.str());
    }

    template <typename... Args>
    static void log(LogLevel level, const Args&... args) {
        if (level > instance().level_.load() || level == LogLevel::None) {
            return;
        }

        std::lock_guard<std::mutex> lock(instance().mutex_);

        auto now        = std::chrono::system_clock::now();
        auto now_time_t = std::chrono::system_clock::to_time_t(now);
        auto now_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::stringstream time_ss;
        time_ss << std::put_time(std::localtime(&now_time_t), "%Y-%m-%d %H:%M:%S") << '.'
                << std::setfill('0') << std::setw(3) << now_ms.count();

        const char* level_color  = "";
        const char* level_prefix = "";
        switch (level) {
        case LogLevel::Error:
            level_color  = TerminalColors::RED;
            level_prefix = "[ERROR]";
            break;
        case LogLevel::Warn:
            level_color  = TerminalColors::YELLOW;
            level_prefix = "[WARN]";
            break;
        case LogLevel::Info:
            level_color  = TerminalColors::GREEN;
            level_prefix = "[INFO]";
            break;
        case LogLevel::Debug:
            level_color  = TerminalColors::CYAN;
            level_prefix = "[DEBUG]";
            break;
        case LogLevel::Trace:
            level_color  = TerminalColors::WHITE;
            level_prefix = "[TRACE]";
            break;
        default:
            break;
        }

        std::stringstream content;
        (content << ... << args);

        if (instance().enable_console_) {
            std::cout << TerminalColors::WHITE << time_ss.str() << TerminalColors::RESET << " "
                      << level_color << TerminalColors::BOLD << level_prefix
                      << TerminalColors::RESET << " " << content.str() << std::endl;
        }

        // File output carries no color codes
        if (instance().enable_file_ && instance().log_file_.is_open()) {
            instance().log_file_ << removeColorCodes(time_ss.str() + " " + level_prefix + " " +
                                                     content.str())
                                 << std::endl;
            instance().log_file_.flush();
        }
    }

    // Scoped timer reporting through logPerformance on destruction
    class Timer {
    public:
        Timer(const std::string& operation, const std::string& details = "")
            : operation_(operation), details_(details),
              start_(std::chrono::high_resolution_clock::now()) {}

        ~Timer() {
            auto end = std::chrono::high_resolution_clock::now();
            auto duration =
                std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count() /
                1000.0;
            logPerformance(operation_, duration, details_);
        }

    private:
        std::string                                                 operation_;
        std::string                                                 details_;
        std::chrono::time_point<std::chrono::high_resolution_clock> start_;
    };

    static std::string levelToString(LogLevel level) {
        switch (level) {
        case LogLevel::None:
            return "None";
        case LogLevel::Error:
            return "Error";
        case LogLevel::Warn:
            return "Warning";
        case LogLevel::Info:
            return "Info";
        case LogLevel::Debug:
            return "Debug";
        case LogLevel::Trace:
            return "Trace";
        default:
            return "Unknown";
        }
    }

private:
    static std::string removeColorCodes(const std::string& input) {
        std::string result;
        bool        in_escape_sequence = false;

        for (char c : input) {
            if (c == '\033') {
                in_escape_sequence = true;
                continue;
            }

            if (in_escape_sequence) {
                if (c == 'm') {
                    in_escape_sequence = false;
                }
                continue;
            }

            result += c;
        }

        return result;
    }

    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    Logger()
        : level_(LogLevel::None), enable_console_(false), enable_file_(false),
          fast_path_logging_enabled_(false) {}

    ~Logger() {
        if (log_file_.is_open()) {
            log_file_.close();
        }
    }

    std::mutex            mutex_;
    std::atomic<LogLevel> level_;
    bool                  enable_console_;
    bool                  enable_file_;
    std::ofstream         log_file_;
    std::atomic<bool>     fast_path_logging_enabled_;
};

#define LOG_ERROR(...) ::lattice::logging::Logger::log(::lattice::logging::LogLevel::Error, __VA_ARGS__)
#define LOG_WARN(...)  ::lattice::logging::Logger::log(::lattice::logging::LogLevel::Warn, __VA_ARGS__)
#define LOG_INFO(...)  ::lattice::logging::Logger::log(::lattice::logging::LogLevel::Info, __VA_ARGS__)
#define LOG_DEBUG(...) ::lattice::logging::Logger::log(::lattice::logging::LogLevel::Debug, __VA_ARGS__)
#define LOG_TRACE(...) ::lattice::logging::Logger::log(::lattice::logging::LogLevel::Trace, __VA_ARGS__)

#define LOG_FASTPATH(component, path, ...)                                                         \
    ::lattice::logging::Logger::logFastPath(component, path, __VA_ARGS__)

#define TIME_OPERATION(operation, details)                                                         \
    ::lattice::logging::Logger::Timer timer##__LINE__(operation, details)

} // namespace lattice::logging
