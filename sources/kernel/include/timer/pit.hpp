#pragma once

#include "timer/tick_source.hpp"

#include "std/spinlock.hpp"

namespace mr {
    /// @brief The legacy 8254 programmable interval timer.
    ///
    /// Owns the channel 0 data port and the command port. Every access to the
    /// port pair goes through this object and is serialized by its lock, so only
    /// one instance should exist for the lifetime of the system.
    class IntervalTimer {
        stdx::SpinLock mLock;
        uint16_t mDivisor GUARDED_BY(mLock) = 0;

        void programOneShot(uint16_t count) REQUIRES(mLock);

        [[nodiscard]]
        OsStatus checkOneShot() REQUIRES(mLock);

        bool isOneShotComplete() REQUIRES(mLock);

        void waitForOneShot() REQUIRES(mLock);

    public:
        static constexpr hertz kFrequencyHz = Hertz(1'193'182);

        static constexpr uint16_t kChannel0 = 0x40;
        static constexpr uint16_t kCommand = 0x43;

        /// @brief Largest count a single one shot can be programmed with.
        static constexpr uint64_t kMaxCount = 0xFFFF;

        UTIL_NOCOPY(IntervalTimer);
        UTIL_NOMOVE(IntervalTimer);

        constexpr IntervalTimer() noexcept = default;

        /// @brief The frequency of the periodic output, zero if no divisor has been set.
        hertz frequency();

        static uint16_t bestDivisor(hertz frequency);

        /// @brief Program channel 0 as a periodic rate generator.
        void setDivisor(uint16_t divisor);

        void setFrequency(hertz frequency) {
            setDivisor(bestDivisor(frequency));
        }

        uint16_t getCount();

        /// @brief Time a single one shot interval against another counter.
        ///
        /// Programs a one shot of @p interval, samples @p counter before and after it
        /// elapses and reports the difference. The interval must fit in one count.
        ///
        /// @retval OsStatusDeviceBusy Another caller currently owns the timer.
        /// @retval OsStatusDeviceNotReady The timer did not accept the one shot programming.
        /// @retval OsStatusInvalidInput The interval is zero or too long for one count.
        [[nodiscard]]
        OsStatus measure(Period interval, const ITickSource *counter, uint64_t *delta);

        /// @brief Spin until @p duration elapses.
        ///
        /// Long durations are split into back to back one shots.
        ///
        /// @retval OsStatusDeviceNotReady The timer did not accept the one shot programming.
        [[nodiscard]]
        OsStatus sleep(Period duration);
    };
}
