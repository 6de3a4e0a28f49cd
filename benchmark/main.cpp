#include <benchmark/benchmark.h>

#ifdef LATTICE_LOGGING_ENABLED
    #include "lattice/common/config.hpp"
    #include "lattice/common/logging.hpp"
#endif

int main(int argc, char** argv) {
#ifdef LATTICE_LOGGING_ENABLED
    // Initialize logging if enabled
    auto config = lattice::config::ViewConfig::from_environment();
    if (config.log_level == lattice::logging::LogLevel::None) {
        config.log_level = lattice::logging::LogLevel::Info;
    }
    lattice::config::apply(config);
    LOG_INFO("Starting benchmarks...");
#endif

    // Run benchmarks
    ::benchmark::Initialize(&argc, argv);
    if (::benchmark::ReportUnrecognizedArguments(argc, argv)) {
        return 1;
    }
    ::benchmark::RunSpecifiedBenchmarks();
    ::benchmark::Shutdown();

#ifdef LATTICE_LOGGING_ENABLED
    LOG_INFO("Benchmarks completed");
#endif

    return 0;
}
