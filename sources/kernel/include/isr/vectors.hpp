#pragma once

#include <meridian/status.h>

#include "util/format.hpp"

#include <array>
#include <string_view>
#include <utility>

#include <stdint.h>

namespace mr {
    /// @brief First vector available after the architectural exceptions.
    static constexpr uint8_t kVectorBase = 0x20;

    /// @brief Logical interrupt sources and the vectors they are delivered on.
    ///
    /// The numeric values are an ABI shared with the local apic programming
    /// and the dispatch table, they must stay consecutive from @a kVectorBase.
    enum class InterruptVector : uint8_t {
        eSpurious = kVectorBase,
        eLocalTimer,
        eLocalError,
        eKeyboard,
        eReschedule,
    };

    struct InterruptVectorInfo {
        InterruptVector vector;
        std::string_view name;
    };

    static constexpr auto kInterruptVectors = std::to_array<InterruptVectorInfo>({
        { InterruptVector::eSpurious, "Spurious" },
        { InterruptVector::eLocalTimer, "Local Timer" },
        { InterruptVector::eLocalError, "Local Error" },
        { InterruptVector::eKeyboard, "Keyboard" },
        { InterruptVector::eReschedule, "Reschedule" },
    });

    static constexpr size_t kInterruptVectorCount = kInterruptVectors.size();

    /// @brief One past the highest vector in the table.
    static constexpr uint8_t kVectorLimit = kVectorBase + kInterruptVectorCount;

    constexpr uint8_t VectorNumber(InterruptVector vector) noexcept MR_NONBLOCKING {
        return std::to_underlying(vector);
    }

    constexpr size_t VectorIndex(InterruptVector vector) noexcept MR_NONBLOCKING {
        return VectorNumber(vector) - kVectorBase;
    }

    constexpr const InterruptVectorInfo& GetVectorInfo(InterruptVector vector) noexcept {
        return kInterruptVectors[VectorIndex(vector)];
    }

    /// @brief Check every vector in the table against the range the hardware accepts.
    ///
    /// @param minVector The lowest vector the interrupt controller will deliver.
    /// @param maxVector The highest vector the interrupt controller will deliver.
    ///
    /// @retval OsStatusOutOfBounds A vector lies outside the deliverable range.
    /// @retval OsStatusInvalidData The table is not consecutive from the base or overlaps the exceptions.
    [[nodiscard]]
    OsStatus ValidateVectorTable(uint8_t minVector, uint8_t maxVector) noexcept;
}

template<>
struct mr::Format<mr::InterruptVector> {
    static void format(mr::IOutStream& out, mr::InterruptVector vector) {
        out.format(mr::GetVectorInfo(vector).name, " (", mr::Hex(mr::VectorNumber(vector)).pad(2), ")");
    }
};
