#include "timer/local_timer.hpp"

#include "timer/apic_timer.hpp"

#include "apic.hpp"
#include "isr/vectors.hpp"

#include "logger/categories.hpp"

using LocalTickTimer = mr::LocalTickTimer;

static constexpr uint8_t kTimerVector = mr::VectorNumber(mr::InterruptVector::eLocalTimer);

OsStatus LocalTickTimer::armPeriodicTick() {
    uint64_t quantum = 0;
    if (OsStatus status = PeriodToTicks(kTickQuantum, mCounter->frequency(), &quantum)) {
        TimerLog.errorf("Cannot arm the local tick: ", OsStatusId(status));
        return status;
    }

    mApic->mask(apic::Ivt::eThermal);

    mApic->cfgIvtTimer(apic::IvtConfig {
        .vector = kTimerVector,
        .polarity = apic::Polarity::eActiveHigh,
        .trigger = apic::Trigger::eEdge,
        .enabled = true,
        .timer = apic::TimerMode::eDeadline,
    });

    mQuantum = quantum;
    mMode = TickMode::eDeadline;
    mDeadline = mCounter->ticks() + mQuantum;
    mApic->setTscDeadline(mDeadline);

    TimerLog.dbgf("Local tick armed, quantum ", kTickQuantum, " (", mQuantum, " ticks)");

    return OsStatusSuccess;
}

OsStatus LocalTickTimer::armCountdown(Period period, TickMode mode) {
    if (mApicTimer == nullptr) {
        return OsStatusNotSupported;
    }

    uint64_t count = 0;
    if (OsStatus status = PeriodToTicks(period, mApicTimer->frequency(), &count)) {
        return status;
    }

    if (count == 0 || count > UINT32_MAX) {
        return OsStatusOutOfBounds;
    }

    apic::TimerMode timerMode = (mode == TickMode::ePeriodic)
        ? apic::TimerMode::ePeriodic
        : apic::TimerMode::eOneShot;

    mApic->mask(apic::Ivt::eThermal);
    mApic->setTscDeadline(0);
    mApic->setTimerDivisor(apic::TimerDivide::e1);

    mApic->cfgIvtTimer(apic::IvtConfig {
        .vector = kTimerVector,
        .polarity = apic::Polarity::eActiveHigh,
        .trigger = apic::Trigger::eEdge,
        .enabled = true,
        .timer = timerMode,
    });

    mQuantum = 0;
    mDeadline = 0;
    mMode = mode;
    mApic->setInitialCount(count);

    return OsStatusSuccess;
}

OsStatus LocalTickTimer::armOneShot(Period period) {
    return armCountdown(period, TickMode::eOneShot);
}

OsStatus LocalTickTimer::armLegacyPeriodic(Period period) {
    return armCountdown(period, TickMode::ePeriodic);
}

void LocalTickTimer::disable() noexcept {
    mApic->mask(apic::Ivt::eTimer);
    mApic->setTscDeadline(0);
    mApic->setInitialCount(0);

    mMode = TickMode::eDisabled;
    mDeadline = 0;
}

void LocalTickTimer::onTimerInterrupt() noexcept MR_NONBLOCKING {
    mTickCount.fetch_add(1, std::memory_order_relaxed);

    switch (mMode) {
    case TickMode::eDeadline:
        mDeadline = mCounter->ticks() + mQuantum;
        mApic->setTscDeadline(mDeadline);
        break;

    case TickMode::eOneShot:
        mMode = TickMode::eDisabled;
        break;

    case TickMode::ePeriodic:
    case TickMode::eDisabled:
        break;
    }
}
