#pragma once

#include "logger/appender.hpp"

namespace mr {
    /// @brief Writes log messages to the bochs/qemu debug console port.
    class E9Appender final : public ILogAppender {
    public:
        static constexpr uint16_t kLogPort = 0xE9;

        constexpr E9Appender() noexcept = default;

        void write(const LogMessageView& message) override;

        /// @brief Reading the debug port returns the port number when the console is present.
        static bool isAvailable() noexcept;
    };
}
