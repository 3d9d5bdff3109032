#include <gtest/gtest.h>
#include "TestHelper.hpp"
#include "core/Logger.hpp"
#include <atomic>
#include <chrono>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace fretboard;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::drain_log();
    }
    void TearDown() override {
        Logger::instance().set_min_level(LogEntry::Level::Debug);
        Logger::instance().set_log_to_console(false);
        test::drain_log();
    }
};

TEST_F(LoggerTest, SingleThreadedPushPop) {
    auto& logger = Logger::instance();

    logger.log_message("TEST", "Hello World");
    logger.log_event("VALUE", 42.0f);

    auto entry1 = logger.pop_entry();
    ASSERT_TRUE(entry1.has_value());
    EXPECT_EQ(entry1->type, LogEntry::Type::Message);
    EXPECT_EQ(entry1->level, LogEntry::Level::Info);
    EXPECT_STREQ(entry1->tag, "TEST");
    EXPECT_STREQ(entry1->message, "Hello World");

    auto entry2 = logger.pop_entry();
    ASSERT_TRUE(entry2.has_value());
    EXPECT_EQ(entry2->type, LogEntry::Type::Event);
    EXPECT_STREQ(entry2->tag, "VALUE");
    EXPECT_EQ(entry2->value, 42.0f);
    EXPECT_GE(entry2->timestamp_us, entry1->timestamp_us);

    EXPECT_FALSE(logger.pop_entry().has_value());
}

TEST_F(LoggerTest, MacrosSetLevel) {
    LOG_DEBUG("Quiz", "d");
    LOG_INFO("Quiz", "i");
    LOG_WARN("Quiz", "w");
    LOG_ERROR("Quiz", "e");

    const LogEntry::Level expected[] = {
        LogEntry::Level::Debug, LogEntry::Level::Info, LogEntry::Level::Warning, LogEntry::Level::Error
    };
    for (auto level : expected) {
        auto entry = Logger::instance().pop_entry();
        ASSERT_TRUE(entry.has_value());
        EXPECT_EQ(entry->level, level);
    }
}

TEST_F(LoggerTest, MinLevelFiltersMessages) {
    auto& logger = Logger::instance();
    logger.set_min_level(LogEntry::Level::Warning);

    LOG_DEBUG("Quiz", "hidden");
    LOG_INFO("Quiz", "hidden");
    LOG_WARN("Quiz", "shown");

    auto warn = logger.pop_entry();
    ASSERT_TRUE(warn.has_value());
    EXPECT_STREQ(warn->message, "shown");
    EXPECT_FALSE(logger.pop_entry().has_value());
}

TEST_F(LoggerTest, EventsFilteredAsDebug) {
    auto& logger = Logger::instance();
    logger.set_min_level(LogEntry::Level::Info);
    logger.set_log_to_console(true);

    // One second of 512-frame periods at 48 kHz
    for (int i = 0; i < 94; ++i) {
        logger.log_event("PROC_US", 120.0f);
    }
    LOG_INFO("Synth", "Audio output ready at 48000 Hz");

    std::ostringstream out;
    logger.flush(out);
    EXPECT_EQ(out.str().find("EVENT"), std::string::npos);
    EXPECT_NE(out.str().find("INFO Synth"), std::string::npos);

    logger.set_min_level(LogEntry::Level::Debug);
    logger.log_event("XRUN", -32.0f);
    auto event = logger.pop_entry();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->type, LogEntry::Type::Event);
}

TEST_F(LoggerTest, LongTextIsTruncated) {
    const std::string long_tag(100, 't');
    const std::string long_msg(500, 'm');
    Logger::instance().log_message(long_tag, long_msg);

    auto entry = Logger::instance().pop_entry();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(std::string(entry->tag).size(), sizeof(entry->tag) - 1);
    EXPECT_EQ(std::string(entry->message).size(), sizeof(entry->message) - 1);
}

TEST_F(LoggerTest, FullBufferDropsAndCounts) {
    auto& logger = Logger::instance();
    const size_t dropped_before = logger.dropped();

    const size_t attempts = Logger::CAPACITY + 100;
    for (size_t i = 0; i < attempts; ++i) {
        logger.log_event("FILL", static_cast<float>(i));
    }

    size_t popped = 0;
    while (logger.pop_entry()) ++popped;

    EXPECT_EQ(popped, Logger::CAPACITY);
    EXPECT_EQ(logger.dropped() - dropped_before, attempts - popped);
}

TEST_F(LoggerTest, FlushFormatsWhenConsoleEnabled) {
    auto& logger = Logger::instance();

    LOG_WARN("Synth", "Audio unavailable");
    std::ostringstream silent;
    logger.flush(silent);
    EXPECT_TRUE(silent.str().empty());
    EXPECT_FALSE(logger.pop_entry().has_value());

    logger.set_log_to_console(true);
    LOG_WARN("Synth", "Audio unavailable");
    logger.log_event("PROC_US", 12.0f);
    std::ostringstream out;
    logger.flush(out);

    const std::string text = out.str();
    EXPECT_NE(text.find("WARN Synth: Audio unavailable"), std::string::npos);
    EXPECT_NE(text.find("EVENT PROC_US=12"), std::string::npos);
}

TEST_F(LoggerTest, MultiThreadedCapture) {
    auto& logger = Logger::instance();

    std::atomic<bool> running{true};
    std::vector<LogEntry> captured;

    // "Background" thread (Consumer)
    std::thread consumer([&]() {
        while (running || captured.size() < 100) {
            if (auto entry = logger.pop_entry()) {
                captured.push_back(*entry);
            } else if (!running) {
                break;
            } else {
                std::this_thread::yield();
            }
        }
    });

    // "Audio" thread (Producer)
    std::thread producer([&]() {
        for (int i = 0; i < 100; ++i) {
            logger.log_event("ITER", static_cast<float>(i));
        }
    });

    producer.join();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    running = false;
    consumer.join();

    ASSERT_EQ(captured.size(), 100u);
    EXPECT_STREQ(captured[0].tag, "ITER");
    EXPECT_EQ(captured[0].value, 0.0f);
    EXPECT_EQ(captured.back().value, 99.0f);
}

TEST_F(LoggerTest, ConcurrentProducersLoseNothing) {
    auto& logger = Logger::instance();
    const size_t dropped_before = logger.dropped();
    constexpr int PER_THREAD = 400;

    std::atomic<bool> go{false};
    auto produce = [&](const char* tag) {
        while (!go) std::this_thread::yield();
        for (int i = 0; i < PER_THREAD; ++i) {
            logger.log_event(tag, static_cast<float>(i));
            if (i % 16 == 0) std::this_thread::yield();
        }
    };
    std::thread audio(produce, "AUDIO");
    std::thread quiz(produce, "QUIZ");
    go = true;
    audio.join();
    quiz.join();

    std::vector<float> audio_values;
    std::vector<float> quiz_values;
    while (auto entry = logger.pop_entry()) {
        if (std::string(entry->tag) == "AUDIO") audio_values.push_back(entry->value);
        else if (std::string(entry->tag) == "QUIZ") quiz_values.push_back(entry->value);
    }

    // 800 entries fit in the ring, so nothing is dropped and each producer's order survives
    EXPECT_EQ(logger.dropped(), dropped_before);
    ASSERT_EQ(audio_values.size(), static_cast<size_t>(PER_THREAD));
    ASSERT_EQ(quiz_values.size(), static_cast<size_t>(PER_THREAD));
    for (int i = 0; i < PER_THREAD; ++i) {
        EXPECT_EQ(audio_values[i], static_cast<float>(i));
        EXPECT_EQ(quiz_values[i], static_cast<float>(i));
    }
}
