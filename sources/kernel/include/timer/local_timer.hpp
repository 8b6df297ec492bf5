#pragma once

#include <meridian/status.h>

#include "common/util/util.hpp"

#include "timer/tick_source.hpp"

#include <atomic>

namespace mr {
    class IApic;
    class ApicTimer;

    /// @brief The scheduling quantum of the local tick.
    static constexpr Period kTickQuantum = Period::millis(1);

    enum class TickMode : uint8_t {
        /// @brief Fire once after an apic timer countdown.
        eOneShot,

        /// @brief Fire repeatedly from the apic timer countdown.
        ePeriodic,

        /// @brief Fire when the invariant tsc reaches the deadline, rearmed from the interrupt.
        eDeadline,

        eDisabled,
    };

    /// @brief The scheduling tick of a single core.
    ///
    /// Owned by the core it ticks, never shared between cores.
    class LocalTickTimer {
        IApic *mApic;
        const ITickSource *mCounter;
        const ApicTimer *mApicTimer;

        TickMode mMode = TickMode::eDisabled;

        /// @brief Quantum in @a mCounter ticks, only valid in deadline mode.
        uint64_t mQuantum = 0;
        uint64_t mDeadline = 0;

        std::atomic<uint64_t> mTickCount = 0;

        [[nodiscard]]
        OsStatus armCountdown(Period period, TickMode mode);

    public:
        UTIL_NOCOPY(LocalTickTimer);
        UTIL_NOMOVE(LocalTickTimer);

        /// @param apic The local apic of the owning core.
        /// @param counter The calibrated fast counter the deadline is measured in.
        /// @param timer The trained apic timer, required for the countdown modes.
        LocalTickTimer(IApic *apic, const ITickSource *counter, const ApicTimer *timer = nullptr) noexcept
            : mApic(apic)
            , mCounter(counter)
            , mApicTimer(timer)
        { }

        /// @brief Arm the periodic scheduling tick in tsc deadline mode.
        ///
        /// @retval OsStatusNotCalibrated The fast counter has no published frequency.
        [[nodiscard]]
        OsStatus armPeriodicTick();

        /// @brief Fire a single tick after @p period.
        ///
        /// @retval OsStatusNotSupported No trained apic timer was provided.
        /// @retval OsStatusNotCalibrated The apic timer has no frequency.
        /// @retval OsStatusOutOfBounds @p period does not fit in the countdown register.
        [[nodiscard]]
        OsStatus armOneShot(Period period);

        /// @brief Tick every @p period using the apic timer countdown.
        [[nodiscard]]
        OsStatus armLegacyPeriodic(Period period);

        /// @brief Mask the timer and disarm any pending deadline.
        void disable() noexcept;

        /// @brief Body of the timer interrupt, rearms the next tick.
        ///
        /// @note The caller is responsible for signalling end of interrupt.
        void onTimerInterrupt() noexcept MR_NONBLOCKING;

        TickMode mode() const noexcept { return mMode; }
        uint64_t tickCount() const noexcept { return mTickCount.load(std::memory_order_relaxed); }
        uint64_t quantum() const noexcept { return mQuantum; }
        uint64_t deadline() const noexcept { return mDeadline; }
    };
}

template<>
struct mr::Format<mr::TickMode> {
    static void format(mr::IOutStream& out, mr::TickMode mode) {
        switch (mode) {
        case mr::TickMode::eOneShot: out.write("one shot"); break;
        case mr::TickMode::ePeriodic: out.write("periodic"); break;
        case mr::TickMode::eDeadline: out.write("deadline"); break;
        case mr::TickMode::eDisabled: out.write("disabled"); break;
        }
    }
};
