#include <gtest/gtest.h>

#include "logger/e9_appender.hpp"
#include "logger/logger.hpp"

#include "ports.hpp"

#include <latch>
#include <string>
#include <vector>
#include <thread>

struct LogMessage {
    mr::LogLevel level;
    const mr::Logger *logger;
    std::string message;
};

class TestAppender final : public mr::ILogAppender {
public:
    std::vector<LogMessage> mMessages;

    void write(const mr::LogMessageView& message) noexcept override {
        mMessages.push_back({
            .level = message.level,
            .logger = message.logger,
            .message = std::string(message.message),
        });
    }
};

class LoggerTest : public testing::Test {
public:
    void SetUp() override {
        ASSERT_EQ(queue.addAppender(&appender), OsStatusSuccess);
    }

    void AssertMessage(size_t index, mr::LogLevel level, std::string_view message) {
        ASSERT_GT(appender.mMessages.size(), index);
        EXPECT_EQ(appender.mMessages[index].level, level);
        EXPECT_EQ(appender.mMessages[index].message, message);
        EXPECT_EQ(appender.mMessages[index].logger, &logger);
    }

    mr::LogQueue queue;
    TestAppender appender;
    mr::Logger logger{"TestLogger", &queue};
};

TEST_F(LoggerTest, Construct) {
    EXPECT_EQ(logger.getName(), "TestLogger");
    EXPECT_EQ(queue.getCommittedCount(), 0);
    EXPECT_EQ(appender.mMessages.size(), 0);
}

TEST_F(LoggerTest, LogMessage) {
    logger.dbgf("Test message");
    EXPECT_EQ(appender.mMessages.size(), 1);
    AssertMessage(0, mr::LogLevel::eDebug, "Test message");
    EXPECT_EQ(queue.getCommittedCount(), 1);
}

TEST_F(LoggerTest, FormatSeverityLevels) {
    logger.dbgf("Debug message ", 25);
    logger.infof("Info message ", true);
    logger.warnf("Warning message ", -1234);
    logger.errorf("Error message ", mr::Hex(0xDEADBEEF), " more text");
    logger.fatalf("Fatal message ", OsStatusId(OsStatusNotCalibrated));

    ASSERT_EQ(appender.mMessages.size(), 5);
    AssertMessage(0, mr::LogLevel::eDebug, "Debug message 25");
    AssertMessage(1, mr::LogLevel::eInfo, "Info message True");
    AssertMessage(2, mr::LogLevel::eWarning, "Warning message -1234");
    AssertMessage(3, mr::LogLevel::eError, "Error message 0xDEADBEEF more text");
    AssertMessage(4, mr::LogLevel::eFatal, "Fatal message 0x001F (NotCalibrated)");
}

TEST_F(LoggerTest, Truncate) {
    std::string longText(1024, 'x');
    logger.infof(std::string_view(longText), "tail");

    ASSERT_EQ(appender.mMessages.size(), 1);
    EXPECT_EQ(appender.mMessages[0].message.size(), mr::kLogMessageSize);
}

TEST_F(LoggerTest, RemoveAppender) {
    queue.removeAppender(&appender);
    logger.info("Nobody is listening");

    EXPECT_EQ(appender.mMessages.size(), 0);
    EXPECT_EQ(queue.getCommittedCount(), 1);
}

TEST_F(LoggerTest, TooManyAppenders) {
    TestAppender extra[4];
    for (size_t i = 0; i < 3; i++) {
        ASSERT_EQ(queue.addAppender(&extra[i]), OsStatusSuccess);
    }

    EXPECT_EQ(queue.addAppender(&extra[3]), OsStatusOutOfMemory);
}

namespace {
    /// @brief Blocks inside the queue lock on its first write until released.
    class BlockingAppender final : public mr::ILogAppender {
    public:
        std::latch entered{1};
        std::atomic<bool> release = false;
        std::vector<std::string> messages;

        void write(const mr::LogMessageView& message) noexcept override {
            if (messages.empty()) {
                entered.count_down();
                while (!release) {
                    std::this_thread::yield();
                }
            }

            messages.push_back(std::string(message.message));
        }
    };
}

class LogQueueContentionTest : public testing::Test {
public:
    void SetUp() override {
        ASSERT_EQ(queue.addAppender(&blocking), OsStatusSuccess);

        writer = std::jthread([this] {
            logger.info("Holding the queue");
        });

        blocking.entered.wait();
    }

    void TearDown() override {
        blocking.release = true;
    }

    void release() {
        blocking.release = true;
        writer.join();
    }

    mr::LogQueue queue;
    BlockingAppender blocking;
    mr::Logger logger{"Contended", &queue};
    std::jthread writer;
};

TEST_F(LogQueueContentionTest, RecordWhenContended) {
    // The queue is held by the writer, this message must be recorded rather than wait.
    logger.infof("Recorded ", 1);
    EXPECT_EQ(queue.getDroppedCount(), 0);
    EXPECT_EQ(queue.getPendingCount(), 1);

    release();
    EXPECT_EQ(queue.getCommittedCount(), 1);

    EXPECT_EQ(queue.flush(), 1);
    EXPECT_EQ(queue.getCommittedCount(), 2);
    EXPECT_EQ(queue.getPendingCount(), 0);

    ASSERT_EQ(blocking.messages.size(), 2);
    EXPECT_EQ(blocking.messages[0], "Holding the queue");
    EXPECT_EQ(blocking.messages[1], "Recorded 1");
}

TEST_F(LogQueueContentionTest, DrainOnNextSubmit) {
    logger.info("First");
    logger.info("Second");

    release();

    logger.info("Third");
    EXPECT_EQ(queue.getCommittedCount(), 4);

    std::vector<std::string> expected = { "Holding the queue", "First", "Second", "Third" };
    EXPECT_EQ(blocking.messages, expected);
}

TEST_F(LogQueueContentionTest, DropWhenFull) {
    for (uint32_t i = 0; i < mr::kLogQueueCapacity + 2; i++) {
        logger.infof("Message ", i);
    }

    EXPECT_EQ(queue.getDroppedCount(), 2);
    EXPECT_EQ(queue.getPendingCount(), mr::kLogQueueCapacity);

    release();

    EXPECT_EQ(queue.flush(), mr::kLogQueueCapacity);
    EXPECT_EQ(queue.getCommittedCount(), mr::kLogQueueCapacity + 1);
    EXPECT_EQ(blocking.messages.back(), "Message 63");
}

TEST(LogQueueTest, ConcurrentRecord) {
    static constexpr size_t kThreadCount = 4;
    static constexpr size_t kMessagesPerThread = 8;
    static_assert(kThreadCount * kMessagesPerThread <= mr::kLogQueueCapacity);

    mr::LogQueue queue;
    TestAppender appender;
    ASSERT_EQ(queue.addAppender(&appender), OsStatusSuccess);
    mr::Logger logger{"Concurrent", &queue};

    std::latch start(kThreadCount);
    {
        std::vector<std::jthread> threads;
        for (size_t i = 0; i < kThreadCount; i++) {
            threads.emplace_back([&] {
                start.arrive_and_wait();
                for (size_t j = 0; j < kMessagesPerThread; j++) {
                    logger.infof("Message ", j);
                }
            });
        }
    }

    queue.flush();

    EXPECT_EQ(queue.getDroppedCount(), 0);
    EXPECT_EQ(queue.getCommittedCount(), kThreadCount * kMessagesPerThread);
    EXPECT_EQ(appender.mMessages.size(), kThreadCount * kMessagesPerThread);
}

namespace {
    class FakeDebugPort : public mrtest::IPeripheral {
    public:
        std::string output;
        bool present = true;

        FakeDebugPort()
            : IPeripheral("E9")
        { }

        void connect(mrtest::PeripheralRegistry& registry) override {
            registry.wire(mr::E9Appender::kLogPort, this);
        }

        void write8(uint16_t, uint8_t value) override {
            output.push_back(char(value));
        }

        uint8_t read8(uint16_t) override {
            return present ? 0xE9 : 0xFF;
        }
    };
}

TEST(E9AppenderTest, Write) {
    FakeDebugPort device;
    mrtest::ScopedPeripheral connection{&device};

    mr::LogQueue queue;
    mr::E9Appender appender;
    ASSERT_EQ(queue.addAppender(&appender), OsStatusSuccess);

    mr::Logger logger{"CLOCK", &queue};
    logger.warnf("Frequency ", 1'000, " Hz");

    EXPECT_EQ(device.output, "[CLOCK:WARN] Frequency 1000 Hz\n");
}

TEST(E9AppenderTest, Available) {
    FakeDebugPort device;
    mrtest::ScopedPeripheral connection{&device};

    EXPECT_TRUE(mr::E9Appender::isAvailable());

    device.present = false;
    EXPECT_FALSE(mr::E9Appender::isAvailable());
}
