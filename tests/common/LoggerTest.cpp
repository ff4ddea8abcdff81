#include <gtest/gtest.h>
#include <loginet/common/Logger.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace loginet;

namespace {

struct RecordedEntry {
    LogLevel level;
    std::string message;
};

/// Backend that stores every entry; shared state outlives the Logger's ownership
class RecordingBackend : public ILoggerBackend {
public:
    explicit RecordingBackend(std::shared_ptr<std::vector<RecordedEntry>> sink)
        : sink_(std::move(sink)) {}

    void log(LogLevel level, const std::string& message, const std::source_location&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level >= minLevel_) {
            sink_->push_back({level, message});
        }
    }
    void setLevel(LogLevel level) override { minLevel_ = level; }
    void flush() override {}

private:
    std::shared_ptr<std::vector<RecordedEntry>> sink_;
    LogLevel minLevel_ = LogLevel::Trace;
    std::mutex mutex_;
};

}  // namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        entries_ = std::make_shared<std::vector<RecordedEntry>>();
        Logger::setBackend(std::make_unique<RecordingBackend>(entries_));
        Logger::clearCapturedLogs();
    }

    void TearDown() override {
        Logger::enableCapture(false);
        Logger::setCaptureLimit(Logger::DEFAULT_CAPTURE_LIMIT);
        Logger::clearCapturedLogs();
        Logger::setBackend(nullptr);
    }

    std::shared_ptr<std::vector<RecordedEntry>> entries_;
};

TEST_F(LoggerTest, InjectedBackendReceivesFormattedMessages) {
    LOG_INFO("MST built with {} edges over {:.1f} m", 4, 1234.56);

    ASSERT_EQ(entries_->size(), 1u);
    EXPECT_EQ(entries_->front().level, LogLevel::Info);
    EXPECT_NE(entries_->front().message.find("MST built with 4 edges over 1234.6 m"), std::string::npos);
}

TEST_F(LoggerTest, MessagesArePrefixedWithFunctionName) {
    LOG_WARN("snap failed");

    ASSERT_EQ(entries_->size(), 1u);
    EXPECT_NE(entries_->front().message.find("() - snap failed"), std::string::npos);
}

TEST_F(LoggerTest, SetLevelIsForwardedToBackend) {
    Logger::setLevel(LogLevel::Error);
    LOG_DEBUG("hidden");
    LOG_ERROR("visible");

    ASSERT_EQ(entries_->size(), 1u);
    EXPECT_EQ(entries_->front().level, LogLevel::Error);
}

TEST_F(LoggerTest, CaptureDisabledByDefault) {
    LOG_INFO("not captured");
    EXPECT_TRUE(Logger::getCapturedLogs().empty());
}

TEST_F(LoggerTest, CaptureFiltersByPattern) {
    Logger::enableCapture(true);
    EXPECT_TRUE(Logger::isCaptureEnabled());

    LOG_DEBUG("Edge 0-1 keeps geodesic weight (no_path)");
    LOG_INFO("Network ready");
    LOG_DEBUG("Edge 1-2 keeps geodesic weight (timeout)");

    auto fallbacks = Logger::getCapturedLogs("geodesic weight");
    ASSERT_EQ(fallbacks.size(), 2u);
    EXPECT_NE(fallbacks[0].find("[debug]"), std::string::npos);
    EXPECT_NE(fallbacks[1].find("timeout"), std::string::npos);

    EXPECT_EQ(Logger::getCapturedLogs().size(), 3u);
}

TEST_F(LoggerTest, CaptureMaxLinesKeepsMostRecent) {
    Logger::enableCapture(true);
    for (int i = 0; i < 5; ++i) {
        LOG_INFO("line {}", i);
    }

    auto tail = Logger::getCapturedLogs("line", 2);
    ASSERT_EQ(tail.size(), 2u);
    EXPECT_NE(tail[0].find("line 3"), std::string::npos);
    EXPECT_NE(tail[1].find("line 4"), std::string::npos);

    Logger::clearCapturedLogs();
    EXPECT_TRUE(Logger::getCapturedLogs().empty());
}

TEST_F(LoggerTest, ConcurrentWritersDoNotLoseEntries) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < 50; ++i) {
                LOG_INFO("worker {} entry {}", t, i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(entries_->size(), 200u);
}

TEST_F(LoggerTest, CaptureFiltersByMinimumLevel) {
    Logger::enableCapture(true);
    LOG_DEBUG("record 3 dropped");
    LOG_WARN("provider attempt 1/3 failed");
    LOG_ERROR("cannot write output");

    auto problems = Logger::getCapturedLogs("", 0, LogLevel::Warn);
    ASSERT_EQ(problems.size(), 2u);
    EXPECT_EQ(problems[0].rfind("[warn]", 0), 0u);
    EXPECT_EQ(problems[1].rfind("[error]", 0), 0u);
}

TEST_F(LoggerTest, CaptureLimitDiscardsOldestLines) {
    Logger::enableCapture(true);
    Logger::setCaptureLimit(3);
    for (int i = 0; i < 6; ++i) {
        LOG_INFO("edge {}", i);
    }

    auto lines = Logger::getCapturedLogs();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_NE(lines.front().find("edge 3"), std::string::npos);
}

TEST_F(LoggerTest, StageTimerStoresElapsedTime) {
    Logger::enableCapture(true);
    double elapsed = -1.0;
    {
        StageTimer timer("spanning tree", elapsed);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    EXPECT_GE(elapsed, 5.0);
    EXPECT_EQ(Logger::getCapturedLogs("Stage 'spanning tree' finished").size(), 1u);
}

TEST(LogLevelTest, NamesAreLowerCase) {
    EXPECT_STREQ(toString(LogLevel::Warn), "warn");
    EXPECT_STREQ(toString(LogLevel::Critical), "critical");
}
