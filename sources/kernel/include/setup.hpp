#pragma once

#include <meridian/status.h>

#include "boot.hpp"
#include "processor.hpp"

#include <span>

namespace mr {
    class IApic;
    class IntervalTimer;
    class CalibratedFrequency;
    class ITickSource;
    class FaultStateTable;
    class FaultCoordinator;
    class FrameAllocator;
    class IsrTable;
    class LocalTickTimer;

    /// @brief The devices owned by a single core.
    struct CoreContext {
        IApic *apic = nullptr;
        LocalTickTimer *timer = nullptr;
    };

    /// @brief Handles to the shared kernel subsystems.
    ///
    /// Built once by the boot core and passed explicitly to every core during bringup.
    struct BootContext {
        IntervalTimer *pit;
        CalibratedFrequency *frequency;
        const ITickSource *counter;
        FaultStateTable *faults;
        FaultCoordinator *coordinator;
        FrameAllocator *memory;
        IsrTable *isrs;

        /// @brief Per core devices indexed by @a CpuCoreId, one slot per enumerated core.
        std::span<CoreContext> cores;
    };

    /// @brief Publish the context the interrupt entry points use.
    void SetBootContext(BootContext *context) noexcept;
    BootContext *GetBootContext() noexcept;

    /// @brief Initialize the shared state on the boot core.
    ///
    /// Builds the frame allocator from @p memmap, sizes the fault table for every core
    /// in @a BootContext::cores, installs the dispatch table and publishes the fault
    /// coordinator and @p context.
    ///
    /// @retval OsStatusInvalidInput the memory map is malformed or there are no cores.
    /// @retval OsStatusInvalidData the interrupt vector table is malformed.
    /// @retval OsStatusOutOfBounds a vector is outside the range the apic delivers.
    [[nodiscard]]
    OsStatus InitSystem(BootContext& context, std::span<const boot::MemoryRegion> memmap);

    /// @brief Bring up a single core.
    ///
    /// Installs the fault and timer entry points, arms the core in the fault table,
    /// calibrates the fast counter if no other core has yet, and starts the local tick.
    ///
    /// @retval OsStatusOutOfBounds @p core has no slot in the context.
    /// @retval OsStatusNotAvailable the core could not be armed for faults.
    /// @retval OsStatusNotCalibrated the fast counter could not be calibrated.
    [[nodiscard]]
    OsStatus InitCore(BootContext& context, CpuCoreId core, IApic *apic, LocalTickTimer *timer);
}
