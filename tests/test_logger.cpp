#include <gtest/gtest.h>
#include <jobrunner/log/logger.hpp>
#include "test_util.hpp"
#include <string>

using namespace jobrunner;
using testutil::TempRoot;
using testutil::read_file;

TEST(Logger, LevelNames) {
    EXPECT_TRUE(logging::set_level(std::string("DEBUG")));
    EXPECT_EQ(logging::level(), LogLevel::Debug);
    EXPECT_TRUE(logging::set_level(std::string("warning")));
    EXPECT_EQ(logging::level(), LogLevel::Warn);
    EXPECT_FALSE(logging::set_level(std::string("chatty")));
    EXPECT_EQ(logging::level(), LogLevel::Warn);
    EXPECT_TRUE(logging::enabled(LogLevel::Error));
    EXPECT_FALSE(logging::enabled(LogLevel::Info));
}

TEST(Logger, FileSinkHonoursLevel) {
    TempRoot tmp;
    auto path = tmp.path / "jobrunner.log";
    ASSERT_TRUE(logging::open_file(path));
    logging::set_level(LogLevel::Info);
    logging::info("job {} started", "abc");
    logging::debug("hidden {}", 1);
    logging::close_file();
    logging::set_level(LogLevel::Warn);

    std::string text = read_file(path);
    EXPECT_NE(text.find("[INFO] job abc started"), std::string::npos);
    EXPECT_EQ(text.find("hidden"), std::string::npos);
}

TEST(Logger, TimestampShape) {
    std::string ts = timestamp_now();
    ASSERT_EQ(ts.size(), 19u);
    EXPECT_EQ(ts[4], '-');
    EXPECT_EQ(ts[10], 'T');
    EXPECT_EQ(ts[13], ':');
}
