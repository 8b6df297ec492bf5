#include "timer/tick_source.hpp"

#include <emmintrin.h>

OsStatus mr::BusySleep(const ITickSource *timer, Period duration) {
    uint64_t ticks = 0;
    if (OsStatus status = PeriodToTicks(duration, timer->frequency(), &ticks)) {
        return status;
    }

    uint64_t now = timer->ticks();
    while (timer->ticks() - now < ticks) {
        _mm_pause();
    }

    return OsStatusSuccess;
}
