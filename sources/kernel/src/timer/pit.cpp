#include "timer/pit.hpp"

#include "delay.hpp"

#include <algorithm>

#include <emmintrin.h>

// Command byte layout: [7:6] channel, [5:4] access mode, [3:1] operating mode, [0] bcd.

static constexpr uint8_t kLatchCountCommand = 0b0000'0000;
static constexpr uint8_t kRateGeneratorCommand = 0b0011'0100;
static constexpr uint8_t kOneShotCommand = 0b0011'0000;

/// @brief Read-back command for channel 0 that latches the status byte only.
static constexpr uint8_t kReadBackStatus = 0b1110'0010;

static constexpr uint8_t kStatusOutput = (1 << 7);
static constexpr uint8_t kStatusModeMask = 0b0011'1110;

static void WriteCount(uint16_t count) {
    MrWriteByte(mr::IntervalTimer::kChannel0, count & 0xFF);
    MrWriteByte(mr::IntervalTimer::kChannel0, (count >> 8) & 0xFF);
}

static uint8_t ReadStatus() {
    MrWriteByte(mr::IntervalTimer::kCommand, kReadBackStatus);
    return MrReadByte(mr::IntervalTimer::kChannel0);
}

void mr::IntervalTimer::programOneShot(uint16_t count) {
    MrWriteByte(kCommand, kOneShotCommand);
    WriteCount(count);
}

OsStatus mr::IntervalTimer::checkOneShot() {
    // A floating bus reads back as 0xFF which does not match any valid
    // one shot status, so this also catches a missing timer.
    uint8_t status = ReadStatus();
    if ((status & kStatusModeMask) != (kOneShotCommand & kStatusModeMask)) {
        return OsStatusDeviceNotReady;
    }

    return OsStatusSuccess;
}

bool mr::IntervalTimer::isOneShotComplete() {
    return ReadStatus() & kStatusOutput;
}

void mr::IntervalTimer::waitForOneShot() {
    while (!isOneShotComplete()) {
        _mm_pause();
    }
}

mr::hertz mr::IntervalTimer::frequency() {
    stdx::LockGuard guard(mLock);
    if (mDivisor == 0) {
        return Hertz(0);
    }

    return Hertz(HertzValue(kFrequencyHz) / mDivisor);
}

uint16_t mr::IntervalTimer::bestDivisor(hertz frequency) {
    uint64_t hz = HertzValue(frequency);
    if (hz == 0) {
        return 0;
    }

    return uint16_t(std::clamp<uint64_t>(HertzValue(kFrequencyHz) / hz, 1, kMaxCount));
}

void mr::IntervalTimer::setDivisor(uint16_t divisor) {
    stdx::LockGuard guard(mLock);

    MrWriteByte(kCommand, kRateGeneratorCommand);
    WriteCount(divisor);

    mDivisor = divisor;
}

uint16_t mr::IntervalTimer::getCount() {
    stdx::LockGuard guard(mLock);

    MrWriteByte(kCommand, kLatchCountCommand);

    uint8_t lo = MrReadByte(kChannel0);
    uint8_t hi = MrReadByte(kChannel0);

    return (hi << 8) | lo;
}

OsStatus mr::IntervalTimer::measure(Period interval, const ITickSource *counter, uint64_t *delta) {
    uint64_t count = 0;
    if (OsStatus status = PeriodToTicks(interval, kFrequencyHz, &count)) {
        return status;
    }

    if (count == 0 || count > kMaxCount) {
        return OsStatusInvalidInput;
    }

    if (!mLock.try_lock()) {
        return OsStatusDeviceBusy;
    }

    programOneShot(count);
    uint64_t start = counter->ticks();

    OsStatus status = checkOneShot();
    if (status == OsStatusSuccess) {
        waitForOneShot();
        uint64_t end = counter->ticks();
        *delta = end - start;
    }

    mLock.unlock();
    return status;
}

OsStatus mr::IntervalTimer::sleep(Period duration) {
    uint64_t remaining = 0;
    if (OsStatus status = PeriodToTicks(duration, kFrequencyHz, &remaining)) {
        return status;
    }

    stdx::LockGuard guard(mLock);

    // The one shots overwrite any rate generator programming.
    mDivisor = 0;

    while (remaining > 0) {
        uint16_t chunk = std::min(remaining, kMaxCount);
        programOneShot(chunk);
        if (OsStatus status = checkOneShot()) {
            return status;
        }

        waitForOneShot();
        remaining -= chunk;
    }

    return OsStatusSuccess;
}
