#pragma once

#include "std/static_string.hpp"

#include <source_location>
#include <string_view>

#include <stdint.h>

namespace mr {
    class Logger;
    class LogQueue;
    class ILogAppender;

    static constexpr size_t kLogMessageSize = 256;

    /// @brief Messages that can wait for the queue lock before new ones are dropped.
    static constexpr uint32_t kLogQueueCapacity = 64;

    enum class LogLevel : uint8_t {
        eDebug = 1,
        eInfo = 2,
        eWarning = 3,
        eError = 4,
        eFatal = 5,
    };

    namespace detail {
        /// @brief An owned copy of a message waiting in the queue.
        struct LogMessage {
            LogLevel level;
            std::source_location location;
            const Logger *logger;
            stdx::StaticString<kLogMessageSize> message;
        };
    }

    struct LogMessageView {
        std::source_location location;
        std::string_view message;
        const Logger *logger;
        LogLevel level;
    };

    class ILogAppender {
    public:
        virtual ~ILogAppender() = default;

        virtual void write(const LogMessageView& message) = 0;
    };
}
