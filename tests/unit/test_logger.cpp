#include <cctype>
#include <string>
#include <gtest/gtest.h>
#include "core/logging/logger.hpp"

namespace {

using mcproxy::core::logging::LogLevel;
using mcproxy::core::logging::Logger;

TEST(LoggerTest, StartSessionTagsWithPrefixedHexId) {
    const std::string id = Logger::get().start_session("px-");
    ASSERT_EQ(id.size(), 11u);
    EXPECT_EQ(id.rfind("px-", 0), 0u);
    for (const char c : id.substr(3)) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c))) << id;
    }

    EXPECT_EQ(Logger::get().start_session("t-").rfind("t-", 0), 0u);
}

TEST(LoggerTest, ParseLevelAcceptsAliases) {
    EXPECT_EQ(Logger::parse_level("TRACE"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parse_level("Warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::parse_level("error"), LogLevel::ERROR);
    EXPECT_FALSE(Logger::parse_level("loud").has_value());
}

}  // namespace
