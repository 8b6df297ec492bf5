#pragma once

#include <meridian/status.h>

#include "timer/pit.hpp"

namespace mr {
    class IApic;
    class ApicTimer;

    [[nodiscard]]
    OsStatus TrainApicTimer(IApic *apic, IntervalTimer& refclk, ApicTimer *timer);

    /// @brief The local apic countdown timer, measured against the interval timer.
    ///
    /// Used for the one shot and divisor periodic tick modes.
    class ApicTimer final : public ITickSource {
        hertz mFrequency = Hertz(0);
        IApic *mApic = nullptr;

        ApicTimer(hertz frequency, IApic *apic)
            : mFrequency(frequency)
            , mApic(apic)
        { }

    public:
        constexpr ApicTimer() = default;

        TickSourceType type() const override { return TickSourceType::APIC; }
        hertz frequency() const override { return mFrequency; }
        uint64_t ticks() const override;

        friend OsStatus mr::TrainApicTimer(IApic *apic, IntervalTimer& refclk, ApicTimer *timer);
    };
}
