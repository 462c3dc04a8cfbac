#include "utils/logging.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

using eolnorm::utils::init_logging;

TEST(LoggingTest, DefaultLoggerWritesToStderr) {
    init_logging(false);

    auto logger = spdlog::default_logger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->name(), eolnorm::utils::kLoggerName);
    ASSERT_EQ(logger->sinks().size(), 1u);
    EXPECT_NE(std::dynamic_pointer_cast<spdlog::sinks::stderr_color_sink_mt>(logger->sinks()[0]), nullptr);
    EXPECT_EQ(std::dynamic_pointer_cast<spdlog::sinks::stdout_color_sink_mt>(logger->sinks()[0]), nullptr);
}

TEST(LoggingTest, VerboseSelectsDebugLevel) {
    init_logging(true);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);

    init_logging(false);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
    EXPECT_EQ(spdlog::default_logger()->name(), eolnorm::utils::kLoggerName);
}
