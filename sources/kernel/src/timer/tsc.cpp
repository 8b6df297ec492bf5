#include "timer/tsc_timer.hpp"

#include "arch/intrin.hpp"

#include "logger/categories.hpp"

#include <emmintrin.h>

static OsStatus MeasureCounter(mr::IntervalTimer& pit, const mr::ITickSource *counter, uint64_t *hz) {
    OsStatus status = OsStatusDeviceNotReady;
    unsigned attempt = 0;

    while (attempt < mr::kCalibrationAttempts) {
        uint64_t delta = 0;
        status = pit.measure(mr::kCalibrationInterval, counter, &delta);

        // Another caller owns the reference clock, wait for it to finish.
        // Only a measurement that actually ran counts as an attempt.
        if (status == OsStatusDeviceBusy) {
            _mm_pause();
            continue;
        }

        attempt += 1;

        if (status == OsStatusDeviceNotReady) {
            ClockLog.warnf("Reference clock not ready, attempt ", attempt, " of ", mr::kCalibrationAttempts);
            continue;
        }

        if (status != OsStatusSuccess) {
            return status;
        }

        if (delta == 0) {
            ClockLog.warnf("Fast counter did not advance over ", mr::kCalibrationInterval, ", attempt ", attempt, " of ", mr::kCalibrationAttempts);
            status = OsStatusDeviceNotReady;
            continue;
        }

        *hz = delta * (mr::Period::kMicrosPerSecond / mr::kCalibrationInterval.raw());
        return OsStatusSuccess;
    }

    return status;
}

uint64_t mr::InvariantTsc::ticks() const {
    uint32_t aux;
    return arch::Intrin::rdtscp(&aux);
}

OsStatus mr::CalibrateTsc(IntervalTimer& pit, const ITickSource *counter, CalibratedFrequency& frequency, hertz *result) {
    OsStatus status = frequency.publish([&](uint64_t *hz) {
        return MeasureCounter(pit, counter, hz);
    });

    switch (status) {
    case OsStatusSuccess:
        ClockLog.infof(counter->type(), " frequency: ", frequency.load());
        [[fallthrough]];
    case OsStatusCompleted:
        *result = frequency.load();
        return OsStatusSuccess;

    default:
        ClockLog.errorf("Failed to calibrate ", counter->type(), " after ", kCalibrationAttempts, " attempts: ", OsStatusId(status));
        return status;
    }
}
