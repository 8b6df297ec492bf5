#pragma once

#include <algorithm>
#include <cstddef>
#include <string_view>

namespace stdx {
    /// @brief A string with fixed inline storage, writes past the capacity are truncated.
    template<size_t N>
    class StaticString {
        size_t mSize = 0;
        char mStorage[N];

    public:
        constexpr StaticString() noexcept = default;

        constexpr StaticString(std::string_view str) noexcept {
            add(str);
        }

        constexpr size_t count() const noexcept { return mSize; }
        constexpr size_t capacity() const noexcept { return N; }

        constexpr bool isEmpty() const noexcept { return mSize == 0; }
        constexpr bool isFull() const noexcept { return mSize == N; }

        constexpr const char *begin() const noexcept { return mStorage; }
        constexpr const char *end() const noexcept { return mStorage + mSize; }

        constexpr void clear() noexcept {
            mSize = 0;
        }

        constexpr void add(char c) noexcept {
            if (mSize < N) {
                mStorage[mSize++] = c;
            }
        }

        constexpr void add(std::string_view str) noexcept {
            size_t size = std::min(str.size(), N - mSize);
            std::copy_n(str.data(), size, mStorage + mSize);
            mSize += size;
        }

        constexpr std::string_view view() const noexcept {
            return std::string_view(mStorage, mSize);
        }

        constexpr operator std::string_view() const noexcept {
            return view();
        }

        constexpr bool operator==(std::string_view other) const noexcept {
            return view() == other;
        }
    };
}
