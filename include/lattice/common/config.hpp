#pragma once

#include "lattice/common/logging.hpp"
#include <string>
#include <string_view>

namespace lattice {
namespace config {

struct ViewConfig {
    logging::LogLevel log_level{logging::LogLevel::None};
    bool              console{true};
    std::string       log_file;
    bool              fast_path_logging{false};
    // Whether view() validates indices when the caller does not say otherwise
    bool checked_by_default{true};

    // Overrides defaults with LATTICE_LOG_LEVEL, LATTICE_LOG_FILE,
    // LATTICE_FASTPATH_LOG and LATTICE_CHECKED when they are set.
    [[nodiscard]] static ViewConfig from_environment();
};

[[nodiscard]] logging::LogLevel parse_log_level(std::string_view text);
[[nodiscard]] bool              parse_flag(std::string_view text);

// Initializes the logger and installs the process-wide defaults
void apply(const ViewConfig& config);

[[nodiscard]] bool checked_by_default() noexcept;

} // namespace config
} // namespace lattice
