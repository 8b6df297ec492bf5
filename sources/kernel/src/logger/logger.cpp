#include "logger/logger.hpp"

#include <algorithm>

void mr::LogQueue::write(const LogMessageView& message) {
    for (size_t i = 0; i < mAppenderCount; i++) {
        mAppenders[i]->write(message);
    }

    mCommittedCount.fetch_add(1, std::memory_order_relaxed);
}

size_t mr::LogQueue::writeAllMessages() {
    size_t count = 0;
    detail::LogMessage message;
    while (mQueue.tryPop(message)) {
        write({ message.location, message.message, message.logger, message.level });
        count++;
    }

    return count;
}

OsStatus mr::LogQueue::addAppender(ILogAppender *appender) noexcept {
    stdx::LockGuard guard(mLock);
    if (mAppenderCount == mAppenders.size()) {
        return OsStatusOutOfMemory;
    }

    mAppenders[mAppenderCount++] = appender;
    return OsStatusSuccess;
}

void mr::LogQueue::removeAppender(ILogAppender *appender) noexcept {
    stdx::LockGuard guard(mLock);
    auto end = mAppenders.begin() + mAppenderCount;
    auto it = std::remove(mAppenders.begin(), end, appender);
    mAppenderCount = std::distance(mAppenders.begin(), it);
}

OsStatus mr::LogQueue::recordMessage(const LogMessageView& message) noexcept {
    detail::LogMessage entry {
        .level = message.level,
        .location = message.location,
        .logger = message.logger,
        .message = message.message,
    };

    if (mQueue.tryPush(entry)) {
        return OsStatusSuccess;
    }

    mDroppedCount.fetch_add(1, std::memory_order_relaxed);
    return OsStatusOutOfMemory;
}

OsStatus mr::LogQueue::submit(const LogMessageView& message) noexcept {
    if (!mLock.try_lock()) {
        return recordMessage(message);
    }

    // Older messages that were recorded under contention go out first.
    writeAllMessages();
    write(message);
    mLock.unlock();
    return OsStatusSuccess;
}

size_t mr::LogQueue::flush() noexcept {
    stdx::LockGuard guard(mLock);
    return writeAllMessages();
}

mr::LogQueue& mr::LogQueue::getGlobalQueue() noexcept {
    static LogQueue sLogQueue;
    return sLogQueue;
}

void mr::Logger::submit(LogLevel level, std::string_view message, std::source_location location) noexcept {
    LogMessageView view {
        .location = location,
        .message = message,
        .logger = this,
        .level = level,
    };

    // Dropped messages are accounted for by the queue.
    (void)mQueue->submit(view);
}

void mr::Logger::dbg(std::string_view message, std::source_location location) noexcept {
    submit(LogLevel::eDebug, message, location);
}

void mr::Logger::info(std::string_view message, std::source_location location) noexcept {
    submit(LogLevel::eInfo, message, location);
}

void mr::Logger::warn(std::string_view message, std::source_location location) noexcept {
    submit(LogLevel::eWarning, message, location);
}

void mr::Logger::error(std::string_view message, std::source_location location) noexcept {
    submit(LogLevel::eError, message, location);
}

void mr::Logger::fatal(std::string_view message, std::source_location location) noexcept {
    submit(LogLevel::eFatal, message, location);
}
