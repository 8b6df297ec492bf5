#pragma once

#include <meridian/status.h>

#include "logger/appender.hpp"

#include "std/ringbuffer.hpp"
#include "std/spinlock.hpp"

#include <array>
#include <atomic>

namespace mr {
    /// @brief Fans log messages out to the registered appenders.
    ///
    /// Submission never waits on the queue lock. A message that arrives while another
    /// core is writing is recorded in the message queue and written out by the next
    /// caller that takes the lock, it is only dropped if the message queue is full.
    /// This keeps logging usable from interrupt and NMI context.
    class LogQueue {
        static constexpr size_t kMaxAppenders = 4;

        using MessageQueue = sm::AtomicRingQueue<detail::LogMessage, kLogQueueCapacity>;

        stdx::SpinLock mLock;
        MessageQueue mQueue;
        std::array<ILogAppender*, kMaxAppenders> mAppenders GUARDED_BY(mLock) {};
        size_t mAppenderCount GUARDED_BY(mLock) = 0;

        /// @brief Number of messages that were dropped due to the message queue being full.
        std::atomic<uint32_t> mDroppedCount{0};

        /// @brief Number of messages that were written out to the appenders.
        std::atomic<uint32_t> mCommittedCount{0};

        void write(const LogMessageView& message) REQUIRES(mLock);
        size_t writeAllMessages() REQUIRES(mLock);

    public:
        LogQueue() noexcept = default;

        [[nodiscard]]
        OsStatus addAppender(ILogAppender *appender) noexcept;
        void removeAppender(ILogAppender *appender) noexcept;

        /// @brief Defer @p message until the next caller that takes the lock.
        ///
        /// @retval OsStatusOutOfMemory The message queue is full, the message was dropped.
        OsStatus recordMessage(const LogMessageView& message) noexcept;

        OsStatus submit(const LogMessageView& message) noexcept;

        /// @brief Write out every recorded message.
        ///
        /// @return The number of messages written.
        size_t flush() noexcept;

        uint32_t getPendingCount() const noexcept {
            return mQueue.count();
        }

        uint32_t getDroppedCount(std::memory_order order = std::memory_order_seq_cst) const noexcept {
            return mDroppedCount.load(order);
        }

        uint32_t getCommittedCount(std::memory_order order = std::memory_order_seq_cst) const noexcept {
            return mCommittedCount.load(order);
        }

        static LogQueue& getGlobalQueue() noexcept;

        [[nodiscard]]
        static OsStatus addGlobalAppender(ILogAppender *appender) noexcept {
            return getGlobalQueue().addAppender(appender);
        }

        static void removeGlobalAppender(ILogAppender *appender) noexcept {
            getGlobalQueue().removeAppender(appender);
        }
    };
}
