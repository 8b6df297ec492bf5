#pragma once

#include <meridian/status.h>

#include "units.hpp"

#include <compare> // IWYU pragma: keep
#include <limits>

#include <stdint.h>

namespace mr {
    /// @brief A duration measured in whole microseconds.
    ///
    /// The raw value is stored exactly as given and never rescaled,
    /// @a fromRaw and @a raw are exact inverses.
    class Period {
        uint64_t mMicros;

        constexpr explicit Period(uint64_t micros) noexcept
            : mMicros(micros)
        { }

    public:
        static constexpr uint64_t kMicrosPerSecond = 1'000'000;

        constexpr Period() noexcept
            : mMicros(0)
        { }

        static constexpr Period fromRaw(uint64_t micros) noexcept {
            return Period(micros);
        }

        static constexpr Period micros(uint64_t micros) noexcept {
            return Period(micros);
        }

        /// @brief Milliseconds that would overflow saturate to @a max.
        static constexpr Period millis(uint64_t millis) noexcept {
            if (millis > max().raw() / 1'000) {
                return max();
            }

            return Period(millis * 1'000);
        }

        static constexpr Period zero() noexcept {
            return Period(0);
        }

        static constexpr Period max() noexcept {
            return Period(std::numeric_limits<uint64_t>::max());
        }

        constexpr uint64_t raw() const noexcept MR_NONBLOCKING {
            return mMicros;
        }

        constexpr bool isMax() const noexcept {
            return *this == max();
        }

        constexpr auto operator<=>(const Period& other) const noexcept = default;
    };

    /// @brief Convert a duration to ticks of a clock running at @p frequency.
    ///
    /// The result saturates at UINT64_MAX rather than wrapping.
    ///
    /// @retval OsStatusNotCalibrated The frequency is zero, the clock has not been calibrated.
    [[nodiscard]]
    constexpr OsStatus PeriodToTicks(Period period, hertz frequency, uint64_t *ticks) noexcept MR_NONBLOCKING {
        uint64_t hz = HertzValue(frequency);
        if (hz == 0) {
            return OsStatusNotCalibrated;
        }

        unsigned __int128 result = (unsigned __int128)period.raw() * hz / Period::kMicrosPerSecond;
        if (result > std::numeric_limits<uint64_t>::max()) {
            *ticks = std::numeric_limits<uint64_t>::max();
        } else {
            *ticks = uint64_t(result);
        }

        return OsStatusSuccess;
    }
}

template<>
struct mr::Format<mr::Period> {
    static void format(mr::IOutStream& out, mr::Period value) {
        if (value.isMax()) {
            out.write("forever");
        } else {
            out.format(value.raw(), "us");
        }
    }
};
