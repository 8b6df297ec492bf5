#pragma once

#include "arch/intrin.hpp"

#include <stdint.h>

namespace x64 {
    enum class RegisterAccess {
        eRead = (1 << 0),
        eWrite = (1 << 1),

        eReadWrite = eRead | eWrite,
    };

    constexpr bool operator&(RegisterAccess lhs, RegisterAccess rhs) noexcept {
        return (int(lhs) & int(rhs)) != 0;
    }

    template<uint32_t R, RegisterAccess A>
    struct ModelRegister {
        static constexpr uint32_t kRegister = R;

        [[gnu::always_inline, gnu::nodebug]]
        uint64_t load() const noexcept requires (A & RegisterAccess::eRead) {
            return arch::Intrin::rdmsr(kRegister);
        }

        [[gnu::always_inline, gnu::nodebug]]
        void store(uint64_t value) const noexcept requires (A & RegisterAccess::eWrite) {
            arch::Intrin::wrmsr(kRegister, value);
        }
    };

    static constexpr ModelRegister<0x6e0, RegisterAccess::eReadWrite> kTscDeadlineMsr{};
    static constexpr ModelRegister<0xc0000103, RegisterAccess::eReadWrite> kTscAuxMsr{};
}
