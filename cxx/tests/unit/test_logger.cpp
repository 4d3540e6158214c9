#include <gtest/gtest.h>
#include "core/Logger.hpp"
#include <atomic>
#include <thread>
#include <chrono>
#include <vector>
#include <sstream>
#include <string>

using namespace wavetone;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Clear any existing entries
        while (AudioLogger::instance().pop_entry()) {}
    }
};

TEST_F(LoggerTest, SingleThreadedPushPop) {
    auto& logger = AudioLogger::instance();

    logger.log_message("TEST", "Hello World");
    logger.log_event("VALUE", 42.0f);

    auto entry1 = logger.pop_entry();
    ASSERT_TRUE(entry1.has_value());
    EXPECT_EQ(entry1->type, LogEntry::Type::Message);
    EXPECT_STREQ(entry1->tag, "TEST");
    EXPECT_STREQ(entry1->message, "Hello World");

    auto entry2 = logger.pop_entry();
    ASSERT_TRUE(entry2.has_value());
    EXPECT_EQ(entry2->type, LogEntry::Type::Event);
    EXPECT_STREQ(entry2->tag, "VALUE");
    EXPECT_EQ(entry2->value, 42.0f);
    EXPECT_GE(entry2->timestamp, entry1->timestamp);

    EXPECT_FALSE(logger.pop_entry().has_value());
}

TEST_F(LoggerTest, LongMessagesAreTruncated) {
    auto& logger = AudioLogger::instance();
    const std::string long_message(200, 'x');

    logger.log_message("TRUNC", long_message.c_str());

    auto entry = logger.pop_entry();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(std::string(entry->message).size(), sizeof(entry->message) - 1);
}

TEST_F(LoggerTest, FlushWritesMessagesAndSummarisesEvents) {
    auto& logger = AudioLogger::instance();

    logger.log_message("ALSA", "Underrun (EPIPE), re-preparing");
    logger.log_event("PROC_US", 12.0f);
    logger.log_event("PROC_US", 30.0f);
    logger.log_event("PROC_US", 7.0f);

    std::ostringstream out;
    EXPECT_EQ(logger.flush(out), 4u);

    const std::string text = out.str();
    EXPECT_NE(text.find("[ALSA] Underrun (EPIPE), re-preparing"), std::string::npos);
    EXPECT_NE(text.find("[PROC_US] 3 events, max 30"), std::string::npos);
    EXPECT_FALSE(logger.pop_entry().has_value());
}

TEST_F(LoggerTest, FlushSummarisesEachEventTagSeparately) {
    auto& logger = AudioLogger::instance();

    logger.log_event("PROC_US", 40.0f);
    logger.log_event("XRUN", 1.0f);
    logger.log_event("PROC_US", 10.0f);
    logger.log_event("XRUN", 2.0f);
    logger.log_event("XRUN", 1.0f);

    std::ostringstream out;
    EXPECT_EQ(logger.flush(out), 5u);

    const std::string text = out.str();
    EXPECT_NE(text.find("[PROC_US] 2 events, max 40"), std::string::npos);
    EXPECT_NE(text.find("[XRUN] 3 events, max 2"), std::string::npos);
}

TEST_F(LoggerTest, FlushCountsTagsBeyondTheSummaryLimit) {
    auto& logger = AudioLogger::instance();

    for (size_t i = 0; i < AudioLogger::MAX_EVENT_TAGS + 2; ++i) {
        const std::string tag = "TAG" + std::to_string(i);
        logger.log_event(tag.c_str(), static_cast<float>(i));
    }

    std::ostringstream out;
    EXPECT_EQ(logger.flush(out), AudioLogger::MAX_EVENT_TAGS + 2);

    const std::string text = out.str();
    EXPECT_NE(text.find("[TAG0] 1 events, max 0"), std::string::npos);
    EXPECT_NE(text.find("[AudioLogger] 2 events with other tags"), std::string::npos);
}

TEST_F(LoggerTest, FlushOfEmptyLoggerWritesNothing) {
    std::ostringstream out;
    EXPECT_EQ(AudioLogger::instance().flush(out), 0u);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(LoggerTest, MultiThreadedCapture) {
    auto& logger = AudioLogger::instance();

    std::atomic<bool> running{true};
    std::vector<LogEntry> captured;

    // "Background" thread (Consumer)
    std::thread consumer([&]() {
        while (running) {
            if (auto entry = logger.pop_entry()) {
                captured.push_back(*entry);
            } else {
                std::this_thread::yield();
            }
        }
        // Producer has joined; pick up whatever is left
        while (auto entry = logger.pop_entry()) {
            captured.push_back(*entry);
        }
    });

    // "Audio" thread (Producer)
    std::thread producer([&]() {
        for (int i = 0; i < 100; ++i) {
            logger.log_event("ITER", static_cast<float>(i));
        }
    });

    producer.join();
    running = false;
    consumer.join();

    ASSERT_EQ(captured.size(), 100u);
    EXPECT_STREQ(captured[0].tag, "ITER");
    EXPECT_EQ(captured[0].value, 0.0f);
    EXPECT_EQ(captured.back().value, 99.0f);
}
