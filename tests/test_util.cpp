#include <gtest/gtest.h>

#include <cstdio>
#include <cstring>

#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"

using namespace termlink;

TEST(UtilTest, ParsesHostPort) {
    std::string host;
    uint16_t port = 0;
    ASSERT_TRUE(parse_host_port("127.0.0.1:40001", host, port));
    EXPECT_EQ("127.0.0.1", host);
    EXPECT_EQ(40001, port);

    EXPECT_FALSE(parse_host_port("localhost", host, port));
    EXPECT_FALSE(parse_host_port("localhost:http", host, port));
    EXPECT_FALSE(parse_host_port("localhost:70000", host, port));
}

TEST(UtilTest, ParsesSizesWithBinarySuffixes) {
    EXPECT_EQ(65536, parse_size("65536"));
    EXPECT_EQ(64 * 1024, parse_size("64k"));
    EXPECT_EQ(16 * 1024 * 1024, parse_size("16M"));
    EXPECT_EQ(int64_t{1} << 30, parse_size("1g"));
    EXPECT_FALSE(parse_size("").has_value());
    EXPECT_FALSE(parse_size("k").has_value());
    EXPECT_FALSE(parse_size("12q").has_value());
    EXPECT_FALSE(parse_size("-4k").has_value());
}

TEST(UtilTest, ParsesLogLevels) {
    EXPECT_EQ(LogLevel::DEBUG, parse_log_level("debug"));
    EXPECT_EQ(LogLevel::WARN, parse_log_level("WARN"));
    EXPECT_EQ(LogLevel::WARN, parse_log_level("warning"));
    EXPECT_FALSE(parse_log_level("loud").has_value());
}

TEST(UtilTest, ErrorCodesCarryTermlinkCategory) {
    std::error_code ec = errc::window_full;
    EXPECT_STREQ("termlink", ec.category().name());
    EXPECT_EQ("send window full", ec.message());
    EXPECT_NE(make_error_code(errc::closed), make_error_code(errc::not_connected));
}

TEST(LoggerTest, FiltersByLevelAndFormatsLines) {
    FILE* out = std::tmpfile();
    ASSERT_NE(nullptr, out);
    Logger& logger = Logger::instance();
    LogLevel saved = logger.level();
    logger.set_output(out);
    logger.set_level(LogLevel::WARN);

    logger.log(LogLevel::INFO, "hidden %d", 1);
    logger.log(LogLevel::WARN, "dropped frame (%zu bytes)", (size_t)12);

    logger.set_output(nullptr);
    logger.set_level(saved);

    std::rewind(out);
    char line[256] = {0};
    ASSERT_NE(nullptr, std::fgets(line, sizeof(line), out));
    EXPECT_NE(nullptr, std::strstr(line, "[WARN] dropped frame (12 bytes)"));
    EXPECT_EQ(nullptr, std::fgets(line, sizeof(line), out));
    std::fclose(out);
}
