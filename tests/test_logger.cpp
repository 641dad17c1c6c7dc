#include "logger.hpp"

#include <gtest/gtest.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <fstream>
#include <sstream>
#include <string>

namespace {

std::string read_file(const char* path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;

    ss << in.rdbuf();
    return ss.str();
}

}

class LoggerTest : public ::testing::Test
{
protected:
    void SetUp() override {
        int fd = mkstemps(path_, 4);
        ASSERT_GE(fd, 0);
        close(fd);
    }

    void TearDown() override {
        Logger::get_instance()->set_filename("");
        Logger::get_instance()->set_level(LOGGER_INFO_LEVEL);
        remove(path_);
    }

    char path_[64] = "/tmp/flvdemux_log_XXXXXX.log";
};

TEST_F(LoggerTest, WritesFilteredLinesToTheFile)
{
    Logger::get_instance()->set_filename(path_);
    Logger::get_instance()->set_level(LOGGER_WARN_LEVEL);

    log_infof("tag count:%d", 1);
    log_warnf("previous tag size:%u mismatch", 7u);
    log_errorf("flv signature error");

    std::string content = read_file(path_);
    EXPECT_EQ(content.find("tag count:1"), std::string::npos);
    EXPECT_NE(content.find("[WARN]"), std::string::npos);
    EXPECT_NE(content.find("previous tag size:7 mismatch"), std::string::npos);
    EXPECT_NE(content.find("[ERROR]"), std::string::npos);
    EXPECT_NE(content.find("[test_logger.cpp:"), std::string::npos);
}

TEST_F(LoggerTest, AppendsAcrossReopen)
{
    Logger::get_instance()->set_filename(path_);
    log_infof("first line");
    Logger::get_instance()->set_filename("");
    Logger::get_instance()->set_filename(path_);
    log_infof("second line");

    std::string content = read_file(path_);
    size_t first = content.find("first line");
    ASSERT_NE(first, std::string::npos);
    EXPECT_NE(content.find("second line", first), std::string::npos);
}
