#include "lattice/common/config.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace lattice::config {

namespace {

std::atomic<bool> g_checked_by_default{true};

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

} // namespace

logging::LogLevel parse_log_level(std::string_view text) {
    const std::string level = lowercase(text);
    if (level == "none" || level == "off") {
        return logging::LogLevel::None;
    }
    if (level == "error") {
        return logging::LogLevel::Error;
    }
    if (level == "warn" || level == "warning") {
        return logging::LogLevel::Warn;
    }
    if (level == "info") {
        return logging::LogLevel::Info;
    }
    if (level == "debug") {
        return logging::LogLevel::Debug;
    }
    if (level == "trace") {
        return logging::LogLevel::Trace;
    }
    throw std::invalid_argument("Unknown log level: " + std::string(text));
}

bool parse_flag(std::string_view text) {
    const std::string flag = lowercase(text);
    if (flag == "1" || flag == "true" || flag == "on" || flag == "yes") {
        return true;
    }
    if (flag == "0" || flag == "false" || flag == "off" || flag == "no") {
        return false;
    }
    throw std::invalid_argument("Expected a boolean flag, got: " + std::string(text));
}

ViewConfig ViewConfig::from_environment() {
    ViewConfig config;
    if (const char* level = std::getenv("LATTICE_LOG_LEVEL")) {
        config.log_level = parse_log_level(level);
    }
    if (const char* file = std::getenv("LATTICE_LOG_FILE")) {
        config.log_file = file;
    }
    if (const char* fast_path = std::getenv("LATTICE_FASTPATH_LOG")) {
        config.fast_path_logging = parse_flag(fast_path);
    }
    if (const char* checked = std::getenv("LATTICE_CHECKED")) {
        config.checked_by_default = parse_flag(checked);
    }
    return config;
}

void apply(const ViewConfig& config) {
    logging::Logger::init(config.log_level, config.console, config.log_file);
    logging::Logger::enableFastPathLogging(config.fast_path_logging);
    g_checked_by_default.store(config.checked_by_default, std::memory_order_relaxed);

    if (!config.checked_by_default) {
        LOG_WARN("Bounds checking disabled by default for view construction");
    }
}

bool checked_by_default() noexcept {
    return g_checked_by_default.load(std::memory_order_relaxed);
}

} // namespace lattice::config
