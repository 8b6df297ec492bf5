#pragma once

#include "common/address.hpp"

#include <memory> // IWYU pragma: keep - std::hash<>

namespace sm {
    struct PhysicalAddress : public sm::Address<PhysicalAddress> {
        using Address::Address;

        static constexpr PhysicalAddress invalid() noexcept {
            return PhysicalAddress { UINTPTR_MAX };
        }
    };
}

template<>
struct std::hash<sm::PhysicalAddress> {
    size_t operator()(const sm::PhysicalAddress& address) const noexcept {
        return std::hash<uintptr_t>()(address.address);
    }
};
