#pragma once

#include <compare> // IWYU pragma: keep

#include <stdint.h>

#include "common/util/util.hpp"

namespace sm {
    /// @brief A range of address space.
    ///
    /// Represents a range of [front, back) addresses. The range is inclusive of the front address
    /// and exclusive of the back address.
    ///
    /// - contains: A range that is totally contained within another range.
    /// - intersects: A range that shares any area with another range, not including touching.
    /// - adjacent: Two ranges that share no area, but are next to each other.
    ///
    /// @pre @a AnyRange::front <= @a AnyRange::back
    template<typename T>
    struct AnyRange {
        using ValueType = T;

        T front;
        T back;

        constexpr uintptr_t size() const noexcept MR_NONBLOCKING {
            return back.address - front.address;
        }

        constexpr bool isEmpty() const noexcept MR_NONBLOCKING {
            return front == back;
        }

        constexpr bool isValid() const noexcept MR_NONBLOCKING {
            return front <= back;
        }

        constexpr bool contains(ValueType addr) const noexcept MR_NONBLOCKING {
            return addr >= front && addr < back;
        }

        constexpr bool contains(AnyRange range) const noexcept MR_NONBLOCKING {
            return range.front >= front && range.back <= back;
        }

        constexpr bool intersects(AnyRange range) const noexcept MR_NONBLOCKING {
            return front < range.back && range.front < back;
        }

        constexpr bool isAdjacent(AnyRange range) const noexcept MR_NONBLOCKING {
            return back == range.front || range.back == front;
        }

        /// @brief Shrink the range inwards so both ends are aligned.
        constexpr AnyRange alignedInward(uintptr_t align) const noexcept MR_NONBLOCKING {
            T newFront = T { sm::roundup<uintptr_t>(front.address, align) };
            T newBack = T { sm::rounddown<uintptr_t>(back.address, align) };
            if (newFront >= newBack) {
                return AnyRange { newFront, newFront };
            }

            return AnyRange { newFront, newBack };
        }

        constexpr bool operator==(const AnyRange& other) const noexcept = default;
    };
}
