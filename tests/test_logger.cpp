#include <gtest/gtest.h>
#include "logger.hpp"

using namespace tether;

TEST(LoggerTest, FormatCarriesLevelAndEvent) {
    std::string line = Logger::format(Logger::Level::WARNING, Logger::EventType::DELIVERY, "laptop",
                                      "Target device is offline");
    EXPECT_NE(line.find("[WARN]"), std::string::npos);
    EXPECT_NE(line.find("[DELIVERY]"), std::string::npos);
    EXPECT_NE(line.find("subject=laptop"), std::string::npos);
    EXPECT_NE(line.find("msg=\"Target device is offline\""), std::string::npos);
}

TEST(LoggerTest, EmptyMessageOmitted) {
    std::string line = Logger::format(Logger::Level::INFO, Logger::EventType::CONNECTION, "phone", "");
    EXPECT_EQ(line.find("msg="), std::string::npos);
    EXPECT_NE(line.find("[CONN]"), std::string::npos);
}

TEST(LoggerTest, AddressesAreBlinded) {
    std::string blinded = Logger::blind_subject("192.168.1.20");
    EXPECT_EQ(blinded.rfind("anon_", 0), 0u);
    EXPECT_EQ(blinded.size(), 5u + 12u);
    EXPECT_EQ(blinded, Logger::blind_subject("192.168.1.20"));
    EXPECT_NE(blinded, Logger::blind_subject("192.168.1.21"));
    EXPECT_EQ(Logger::blind_subject("::1").rfind("anon_", 0), 0u);

    EXPECT_EQ(Logger::blind_subject("session-42"), "session-42");
}

TEST(LoggerTest, MessagesCannotForgeLines) {
    std::string line = Logger::format(Logger::Level::ERROR, Logger::EventType::INVALID_INPUT, "relay",
                                      "bad\n[CRIT] fake \"quoted\"");
    EXPECT_EQ(line.find('\n'), std::string::npos);
    EXPECT_EQ(Logger::sanitize_log_message("a\"b\\c\rd"), "a b c d");
}
