#pragma once

#include "timer/period.hpp"

#include <stdint.h>

namespace mr {
    enum class TickSourceType {
        PIT8254,
        APIC,
        TSC,
    };

    /// @brief A free running counter with a known frequency.
    class ITickSource {
    public:
        virtual ~ITickSource() = default;

        virtual TickSourceType type() const = 0;
        virtual hertz frequency() const = 0;
        virtual uint64_t ticks() const = 0;
    };

    /// @brief Spin until @p duration has elapsed on @p timer.
    ///
    /// @retval OsStatusNotCalibrated The timer does not know its frequency yet.
    [[nodiscard]]
    OsStatus BusySleep(const ITickSource *timer, Period duration);
}
