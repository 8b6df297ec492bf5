#pragma once

#include "common/compiler/compiler.hpp"
#include "common/util/util.hpp"

#include <source_location>
#include <string_view>

/// @brief Halt the current core forever with interrupts disabled.
extern "C" WEAK_SYMBOL_TEST [[noreturn]] void MrHalt(void) noexcept;

namespace mr {
    namespace detail {
        /// @brief Stop the system through the installed fault coordinator, or the local core without one.
        [[noreturn]]
        void RaiseBugCheck(std::string_view message, std::source_location where);
    }

    /// @brief Report an unrecoverable kernel fault.
    ///
    /// Routes to the installed fault coordinator which stops every other core.
    /// Before the coordinator is installed the local core is halted.
    WEAK_SYMBOL_TEST
    [[noreturn]]
    void BugCheck(std::string_view message, std::source_location where = std::source_location::current()) noexcept;
}

#define MR_CHECK(expr, msg) do { if (!(expr)) { mr::BugCheck(msg); } } while (0)
#define MR_ASSERT(expr) do { if (!(expr)) { mr::BugCheck(#expr); } } while (0)
