#include "timer/apic_timer.hpp"

#include "apic.hpp"

#include "logger/categories.hpp"

static constexpr mr::Period kTrainDuration = mr::Period::millis(10);
static constexpr uint64_t kTrainSteps = 10;

uint64_t mr::ApicTimer::ticks() const {
    // The apic timer counts down, invert it so ticks increase.
    return UINT32_MAX - mApic->getCurrentCount();
}

OsStatus mr::TrainApicTimer(IApic *apic, IntervalTimer& refclk, ApicTimer *timer) {
    apic->setTimerDivisor(apic::TimerDivide::e1);

    uint64_t sum = 0;

    for (uint64_t i = 0; i < kTrainSteps; i++) {
        apic->setInitialCount(UINT32_MAX);
        if (OsStatus status = refclk.sleep(kTrainDuration)) {
            apic->setInitialCount(0);
            TimerLog.errorf("APIC timer training failed: ", OsStatusId(status));
            return status;
        }

        uint64_t then = apic->getCurrentCount();

        sum += (UINT32_MAX - then);
    }

    apic->setInitialCount(0);

    uint64_t totalMicros = kTrainSteps * kTrainDuration.raw();
    uint64_t hz = (sum * Period::kMicrosPerSecond) / totalMicros;
    if (hz == 0) {
        return OsStatusDeviceNotReady;
    }

    *timer = ApicTimer { Hertz(hz), apic };
    TimerLog.infof("APIC timer frequency: ", timer->frequency());
    return OsStatusSuccess;
}
