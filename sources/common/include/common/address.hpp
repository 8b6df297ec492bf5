#pragma once

#include <compare> // IWYU pragma: keep - std::strong_ordering

#include <cstddef>
#include <cstdint>

#include "common/compiler/compiler.hpp"

namespace sm {
    /// @brief An address in a given address space.
    ///
    /// @tparam Derived The concrete address type, arithmetic returns this type.
    /// @tparam Storage The integer type that stores the address.
    template<typename Derived, typename Storage = uintptr_t>
    struct Address {
        Storage address;

        constexpr Address() noexcept MR_NONBLOCKING = default;

        constexpr Address(Storage address) noexcept MR_NONBLOCKING
            : address(address)
        { }

        constexpr Address(std::nullptr_t) noexcept MR_NONBLOCKING
            : address(0)
        { }

        constexpr auto operator<=>(const Address& other) const noexcept = default;

        constexpr bool isNull() const noexcept MR_NONBLOCKING {
            return address == 0;
        }

        constexpr bool isAlignedTo(size_t alignment) const noexcept MR_NONBLOCKING {
            return (address % alignment) == 0;
        }

        constexpr Derived operator+(ptrdiff_t offset) const noexcept MR_NONBLOCKING {
            return Derived { Storage(address + offset) };
        }

        constexpr Derived operator-(ptrdiff_t offset) const noexcept MR_NONBLOCKING {
            return Derived { Storage(address - offset) };
        }

        constexpr ptrdiff_t operator-(Address other) const noexcept MR_NONBLOCKING {
            return address - other.address;
        }

        constexpr Derived& operator+=(ptrdiff_t offset) noexcept MR_NONBLOCKING {
            address += offset;
            return static_cast<Derived&>(*this);
        }
    };
}
