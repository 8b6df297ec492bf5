#pragma once

#include "util/format.hpp"

#include "common/util/util.hpp"

#include <utility>

namespace mr {
    using CpuCoreCount = uint32_t;

    enum class CpuCoreId : CpuCoreCount {
        eInvalid = 0xFFFF'FFFF
    };

    /// @brief Tag the current core with its enumeration index.
    ///
    /// The index is kept in IA32_TSC_AUX so it can be recovered from any context,
    /// including NMI handlers that cannot trust the per-cpu segment base.
    WEAK_SYMBOL_TEST
    void InitCoreIdentity(CpuCoreId id) noexcept;

    WEAK_SYMBOL_TEST
    CpuCoreId GetCurrentCoreId() noexcept;
}

template<>
struct mr::Format<mr::CpuCoreId> {
    static void format(mr::IOutStream& out, mr::CpuCoreId id) {
        out.format("CPU", mr::Int(std::to_underlying(id)).pad(3));
    }
};
