#pragma once

#include "memory/range.hpp"

namespace boot {
    /// @brief A region of the physical memory map as reported by the bootloader.
    struct MemoryRegion {
        enum Type {
            eUsable,
            eReserved,
            eAcpiReclaimable,
            eAcpiNvs,
            eBadMemory,
            eBootloaderReclaimable,
            eKernel,
            eFrameBuffer,
        };

        Type type;
        mr::MemoryRange range;

        size_t size() const { return range.size(); }

        bool isUsable() const { return type == eUsable; }
        bool isReclaimable() const { return type == eBootloaderReclaimable || type == eAcpiReclaimable; }
    };
}
