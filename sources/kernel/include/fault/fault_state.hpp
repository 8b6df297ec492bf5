#pragma once

#include <meridian/status.h>

#include "processor.hpp"

#include "std/once.hpp"

#include <atomic>
#include <memory>

namespace mr {
    /// @brief Per core position in the fault protocol.
    ///
    /// Only ever moves forward, @a ePanicked is terminal.
    enum class CoreFaultState : uint8_t {
        /// @brief The core has not installed its fault entry handler yet.
        eNotArmed,

        /// @brief The core will stop when it receives the fault broadcast.
        eArmed,

        /// @brief The core has stopped, or is about to.
        ePanicked,
    };

    enum class FaultTransition {
        /// @brief The cell moved to the requested state.
        eAdvanced,

        /// @brief The cell was already panicked, nothing changed.
        eAlreadyPanicked,

        /// @brief The requested transition skips or reverses a state, nothing changed.
        eRejected,
    };

    using FaultCell = std::atomic<CoreFaultState>;

    static_assert(FaultCell::is_always_lock_free);

    /// @brief Move a fault cell one step forward.
    ///
    /// Lock free and safe to call from NMI context.
    ///
    /// @param cell The cell to update.
    /// @param to The state to move to, must be the successor of the current state.
    ///
    /// @return The outcome of the transition.
    FaultTransition AdvanceFaultState(FaultCell& cell, CoreFaultState to) noexcept MR_NONBLOCKING;

    /// @brief One fault cell per enumerated core.
    ///
    /// The cells are allocated exactly once after core enumeration by @a latch.
    /// Before that every transition is rejected.
    class FaultStateTable {
        struct Storage {
            std::unique_ptr<FaultCell[]> cells;
            CpuCoreCount count = 0;
        };

        stdx::Once<Storage> mStorage;

        /// @brief Set once any cell has reached @a CoreFaultState::ePanicked.
        std::atomic<bool> mFaultObserved = false;

        FaultCell *cell(CpuCoreId core) const noexcept MR_NONBLOCKING;

    public:
        UTIL_NOCOPY(FaultStateTable);
        UTIL_NOMOVE(FaultStateTable);

        constexpr FaultStateTable() noexcept = default;

        /// @brief Allocate the table for @p count cores.
        ///
        /// @retval OsStatusCompleted The table was already latched, nothing was allocated.
        /// @retval OsStatusInvalidInput @p count is zero.
        /// @retval OsStatusOutOfMemory The cells could not be allocated.
        [[nodiscard]]
        OsStatus latch(CpuCoreCount count);

        bool isLatched() const noexcept MR_NONBLOCKING {
            return mStorage.isReady();
        }

        CpuCoreCount count() const noexcept MR_NONBLOCKING;

        bool contains(CpuCoreId core) const noexcept MR_NONBLOCKING {
            return cell(core) != nullptr;
        }

        FaultTransition arm(CpuCoreId core) noexcept MR_NONBLOCKING;
        FaultTransition panic(CpuCoreId core) noexcept MR_NONBLOCKING;

        /// @brief The state of @p core, unlatched tables and unknown cores report @a CoreFaultState::eNotArmed.
        CoreFaultState state(CpuCoreId core) const noexcept MR_NONBLOCKING;

        /// @brief Has any core entered the panicked state.
        bool isFaultObserved() const noexcept MR_NONBLOCKING {
            return mFaultObserved.load(std::memory_order_seq_cst);
        }
    };
}

template<>
struct mr::Format<mr::CoreFaultState> {
    static void format(mr::IOutStream& out, mr::CoreFaultState state) {
        switch (state) {
        case mr::CoreFaultState::eNotArmed: out.write("Not Armed"); break;
        case mr::CoreFaultState::eArmed: out.write("Armed"); break;
        case mr::CoreFaultState::ePanicked: out.write("Panicked"); break;
        }
    }
};
