#pragma once

#include <meridian/status.h>

#include "std/static_string.hpp"

#include "common/compiler/compiler.hpp"

#include <concepts>
#include <limits>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

namespace mr {
    template<typename T>
    struct Format;

    template<typename T>
    concept IsStreamFormat = requires(T it) {
        { Format<T>::format(std::declval<class IOutStream&>(), it) };
    };

    class IOutStream {
    public:
        virtual ~IOutStream() = default;

        virtual void write(std::string_view message) = 0;

        template<typename T> requires (!std::convertible_to<T, std::string_view>)
        void write(const T& value);

        template<typename... T>
        void format(T&&... args) {
            (write(std::forward<T>(args)), ...);
        }
    };

    template<std::integral T>
    struct Int {
        T value;
        int width = 0;
        char fill = '\0';

        constexpr Int(T value) noexcept MR_NONBLOCKING : value(value) {}

        constexpr Int pad(int width, char fill = '0') const noexcept {
            Int copy = *this;
            copy.width = width;
            copy.fill = fill;
            return copy;
        }
    };

    template<std::integral T>
    struct Hex {
        T value;
        int width = 0;
        char fill = '\0';
        bool prefix = true;

        constexpr Hex(T value) noexcept MR_NONBLOCKING : value(value) {}

        constexpr Hex pad(int width, char fill = '0', bool prefix = true) const noexcept {
            Hex copy = *this;
            copy.width = width;
            copy.fill = fill;
            copy.prefix = prefix;
            return copy;
        }
    };

    /// @brief Format an integer into the tail of @p buffer.
    ///
    /// @return A view of the formatted digits inside @p buffer.
    template<std::integral T>
    std::string_view FormatInt(std::span<char> buffer, T input, int base, int width = 0, char fill = '\0') noexcept {
        static constexpr char kDigits[] = "0123456789ABCDEF";
        using U = std::make_unsigned_t<T>;

        bool negative = input < 0;
        U value = negative ? U(0) - U(input) : U(input);

        char *end = buffer.data() + buffer.size();
        char *ptr = end;
        do {
            *--ptr = kDigits[value % base];
            value /= base;
        } while (value != 0 && ptr > buffer.data());

        if (fill != '\0') {
            int remaining = width - int(end - ptr) - (negative ? 1 : 0);
            while (remaining-- > 0 && ptr > buffer.data()) {
                *--ptr = fill;
            }
        }

        if (negative && ptr > buffer.data()) {
            *--ptr = '-';
        }

        return std::string_view(ptr, end - ptr);
    }

    template<std::integral T>
    struct Format<T> {
        static void format(IOutStream& out, T value) {
            char buffer[std::numeric_limits<T>::digits10 + 2];
            out.write(FormatInt(std::span(buffer), value, 10));
        }
    };

    template<>
    struct Format<char> {
        static void format(IOutStream& out, char value) {
            out.write(std::string_view(&value, 1));
        }
    };

    template<>
    struct Format<bool> {
        static void format(IOutStream& out, bool value) {
            out.write(value ? std::string_view("True") : std::string_view("False"));
        }
    };

    template<std::integral T>
    struct Format<Int<T>> {
        static void format(IOutStream& out, Int<T> value) {
            char buffer[std::numeric_limits<T>::digits10 + 2 + 32];
            out.write(FormatInt(std::span(buffer), value.value, 10, value.width, value.fill));
        }
    };

    template<std::integral T>
    struct Format<Hex<T>> {
        static void format(IOutStream& out, Hex<T> value) {
            char buffer[sizeof(T) * 2 + 32];
            if (value.prefix) {
                out.write("0x");
            }

            out.write(FormatInt(std::span(buffer), std::make_unsigned_t<T>(value.value), 16, value.width, value.fill));
        }
    };

    template<>
    struct Format<OsStatusId> {
        static void format(IOutStream& out, OsStatusId value);
    };

    template<IsStreamFormat T>
    inline void format(IOutStream& out, const T& value) {
        Format<T>::format(out, value);
    }

    template<typename T> requires (!std::convertible_to<T, std::string_view>)
    void IOutStream::write(const T& value) {
        mr::format(*this, value);
    }

    /// @brief Format all arguments into a fixed size string, truncating the output.
    template<size_t N, typename... T>
    inline stdx::StaticString<N> concat(T&&... args) noexcept {
        struct OutStream final : public IOutStream {
            stdx::StaticString<N> result;

            void write(std::string_view message) noexcept override {
                result.add(message);
            }

            using IOutStream::write;
        };

        OutStream out;
        (out.format(args), ...);

        return out.result;
    }
}
