#pragma once

#include <concepts>
#include <cstddef>
#include <utility> // IWYU pragma: keep - std::to_underlying

namespace sm {
    template<std::integral T>
    constexpr T roundup(T value, T multiple) {
        return (value + multiple - 1) / multiple * multiple;
    }

    template<std::integral T>
    constexpr T rounddown(T value, T multiple) {
        return value / multiple * multiple;
    }

    constexpr bool isPowerOf2(std::integral auto value) {
        return value && !(value & (value - 1));
    }
}

#define UTIL_NOCOPY(it) \
    it(const it&) = delete; \
    it& operator=(const it&) = delete;

#define UTIL_NOMOVE(it) \
    it(it&&) = delete; \
    it& operator=(it&&) = delete;

#ifdef UTIL_TESTING
#   define WEAK_SYMBOL_TEST [[gnu::weak]]
#else
#   define WEAK_SYMBOL_TEST
#endif
