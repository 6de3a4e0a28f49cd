#include "lattice/common/config.hpp"
#include "lattice/compute/dense_array.hpp"
#include "lattice/compute/view.hpp"

#include <cstdlib>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace lattice;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        ::unsetenv("LATTICE_LOG_LEVEL");
        ::unsetenv("LATTICE_LOG_FILE");
        ::unsetenv("LATTICE_FASTPATH_LOG");
        ::unsetenv("LATTICE_CHECKED");
    }

    void TearDown() override {
        SetUp();
        config::apply(config::ViewConfig{});
    }
};

TEST_F(ConfigTest, ParsesLogLevels) {
    EXPECT_EQ(config::parse_log_level("none"), logging::LogLevel::None);
    EXPECT_EQ(config::parse_log_level("OFF"), logging::LogLevel::None);
    EXPECT_EQ(config::parse_log_level("error"), logging::LogLevel::Error);
    EXPECT_EQ(config::parse_log_level("Warning"), logging::LogLevel::Warn);
    EXPECT_EQ(config::parse_log_level("info"), logging::LogLevel::Info);
    EXPECT_EQ(config::parse_log_level("debug"), logging::LogLevel::Debug);
    EXPECT_EQ(config::parse_log_level("TRACE"), logging::LogLevel::Trace);
    EXPECT_THROW((void)config::parse_log_level("verbose"), std::invalid_argument);
}

TEST_F(ConfigTest, ParsesFlags) {
    EXPECT_TRUE(config::parse_flag("1"));
    EXPECT_TRUE(config::parse_flag("Yes"));
    EXPECT_FALSE(config::parse_flag("off"));
    EXPECT_FALSE(config::parse_flag("FALSE"));
    EXPECT_THROW((void)config::parse_flag("maybe"), std::invalid_argument);
}

TEST_F(ConfigTest, DefaultsWithoutEnvironment) {
    const auto cfg = config::ViewConfig::from_environment();
    EXPECT_EQ(cfg.log_level, logging::LogLevel::None);
    EXPECT_TRUE(cfg.log_file.empty());
    EXPECT_FALSE(cfg.fast_path_logging);
    EXPECT_TRUE(cfg.checked_by_default);
}

TEST_F(ConfigTest, ReadsEnvironment) {
    ::setenv("LATTICE_LOG_LEVEL", "debug", 1);
    ::setenv("LATTICE_FASTPATH_LOG", "on", 1);
    ::setenv("LATTICE_CHECKED", "0", 1);

    const auto cfg = config::ViewConfig::from_environment();
    EXPECT_EQ(cfg.log_level, logging::LogLevel::Debug);
    EXPECT_TRUE(cfg.fast_path_logging);
    EXPECT_FALSE(cfg.checked_by_default);
}

TEST_F(ConfigTest, RejectsMalformedEnvironment) {
    ::setenv("LATTICE_CHECKED", "sometimes", 1);
    EXPECT_THROW((void)config::ViewConfig::from_environment(), std::invalid_argument);
}

TEST_F(ConfigTest, ApplyInstallsDefaults) {
    config::ViewConfig cfg;
    cfg.log_level          = logging::LogLevel::Info;
    cfg.console            = false;
    cfg.fast_path_logging  = true;
    cfg.checked_by_default = false;
    config::apply(cfg);

    EXPECT_FALSE(config::checked_by_default());
    EXPECT_EQ(logging::Logger::level(), logging::LogLevel::Info);
    EXPECT_TRUE(logging::Logger::fastPathLoggingEnabled());

    config::apply(config::ViewConfig{});
    EXPECT_TRUE(config::checked_by_default());
    EXPECT_FALSE(logging::Logger::fastPathLoggingEnabled());
}

TEST_F(ConfigTest, ToggleLoggingWhileConstructingViews) {
    using namespace lattice::compute;
    config::ViewConfig quiet;
    quiet.console = false;
    config::apply(quiet);

    auto a = std::make_shared<DenseArray<float>>(Shape{8, 8});

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&a, t] {
            for (int i = 0; i < 200; ++i) {
                auto v = view(a, {FullSlice{}, Scalar{(t + i) % 8}});
                EXPECT_TRUE(v->is_contiguous());
            }
        });
    }
    for (int i = 0; i < 50; ++i) {
        logging::Logger::setLevel(i % 2 == 0 ? logging::LogLevel::Info : logging::LogLevel::None);
        logging::Logger::enableFastPathLogging(i % 2 == 0);
    }
    for (auto& reader : readers) {
        reader.join();
    }

    logging::Logger::setLevel(logging::LogLevel::None);
    logging::Logger::enableFastPathLogging(false);
    EXPECT_FALSE(logging::Logger::fastPathLoggingEnabled());
}
