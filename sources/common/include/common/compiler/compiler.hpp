#pragma once

#include <compare> // IWYU pragma: keep
#include <string_view>

#include <stdint.h>

namespace sm {
    class Version {
        uint32_t mVersion;

    public:
        constexpr Version(uint8_t major, uint8_t minor, uint16_t patch) noexcept
            : mVersion((uint32_t(major) << 24) | (uint32_t(minor) << 16) | uint32_t(patch))
        { }

        constexpr uint8_t major() const noexcept { return uint8_t(mVersion >> 24); }
        constexpr uint8_t minor() const noexcept { return uint8_t(mVersion >> 16); }
        constexpr uint16_t patch() const noexcept { return uint16_t(mVersion & 0xFFFF); }

        constexpr auto operator<=>(const Version& other) const noexcept = default;
    };

#if defined(__clang__)
    struct Compiler {
        static constexpr std::string_view GetName() noexcept { return __clang_version__; }
        static constexpr Version GetVersion() noexcept {
            return Version(__clang_major__, __clang_minor__, __clang_patchlevel__);
        }
    };
#elif defined(__GNUC__)
    struct Compiler {
        static constexpr std::string_view GetName() noexcept { return __VERSION__; }
        static constexpr Version GetVersion() noexcept {
            return Version(__GNUC__, __GNUC_MINOR__, __GNUC_PATCHLEVEL__);
        }
    };
#else
#   error "Unsupported compiler"
#endif
}

#define COMPILER_PRAGMA(x) _Pragma(#x)

#if defined(__clang__)
#   define DIAGNOSTIC_PUSH() _Pragma("clang diagnostic push")
#   define DIAGNOSTIC_POP() _Pragma("clang diagnostic pop")
#   define DIAGNOSTIC_IGNORE(name) COMPILER_PRAGMA(clang diagnostic ignored name)
#   define CLANG_DIAGNOSTIC_IGNORE(name) DIAGNOSTIC_IGNORE(name)
#else
#   define DIAGNOSTIC_PUSH() _Pragma("GCC diagnostic push")
#   define DIAGNOSTIC_POP() _Pragma("GCC diagnostic pop")
#   define DIAGNOSTIC_IGNORE(name) COMPILER_PRAGMA(GCC diagnostic ignored name)
#   define CLANG_DIAGNOSTIC_IGNORE(name)
#endif

#define DIAGNOSTIC_BEGIN_IGNORE(name) \
    DIAGNOSTIC_PUSH() \
    DIAGNOSTIC_IGNORE(name)

#define DIAGNOSTIC_END_IGNORE() \
    DIAGNOSTIC_POP()

// Function effect attributes are only understood by clang, gcc would warn on every use.
#if defined(__clang__)
#   define MR_NONBLOCKING [[clang::nonblocking]]
#   define MR_BLOCKING [[clang::blocking, clang::nonallocating]]
#else
#   define MR_NONBLOCKING
#   define MR_BLOCKING
#endif
