#pragma once

#include <cstdint>

#include "common/util/util.hpp"

#include "std/spinlock.hpp"
#include "util/format.hpp"

namespace mr {
    static constexpr uint16_t kDefaultYear = 2000;
    static constexpr uint8_t k12HourClock = (1 << 1);
    static constexpr uint8_t kBinaryMode = (1 << 2);
    static constexpr uint8_t kPmHour = (1 << 7);

    struct DateTime {
        uint8_t second;
        uint8_t minute;
        uint8_t hour;
        uint8_t day;
        uint8_t month;
        uint16_t year;

        constexpr bool operator==(const DateTime&) const noexcept = default;
    };

    namespace detail {
        struct CmosRegisters {
            uint8_t regB;

            uint8_t second;
            uint8_t minute;
            uint8_t hour;
            uint8_t day;
            uint8_t month;
            uint16_t year;
            uint8_t century;
        };

        constexpr uint8_t ConvertFromBcd(uint8_t value) {
            return ((value >> 4) * 10) + (value & 0xF);
        }

        DateTime ConvertCmosToDate(CmosRegisters registers);
    }

    /// @brief The legacy battery backed calendar clock.
    ///
    /// Owns the index and data ports. Selecting a register and reading it are
    /// two port accesses, so every read holds the lock for the whole sequence.
    class CalendarClock {
        stdx::SpinLock mLock;
        uint8_t mCenturyRegister;

        uint8_t readRegister(uint8_t reg) REQUIRES(mLock);
        detail::CmosRegisters readRegisters() REQUIRES(mLock);

    public:
        static constexpr uint16_t kIndex = 0x70;
        static constexpr uint16_t kData = 0x71;

        static constexpr uint8_t kSeconds = 0x00;
        static constexpr uint8_t kMinutes = 0x02;
        static constexpr uint8_t kHours = 0x04;
        static constexpr uint8_t kDay = 0x07;
        static constexpr uint8_t kMonth = 0x08;
        static constexpr uint8_t kYear = 0x09;
        static constexpr uint8_t kStatusB = 0x0B;

        UTIL_NOCOPY(CalendarClock);
        UTIL_NOMOVE(CalendarClock);

        /// @param century The century register reported by the FADT, zero if there is none.
        constexpr CalendarClock(uint8_t century = 0) noexcept
            : mCenturyRegister(century)
        { }

        DateTime read();
    };
}

template<>
struct mr::Format<mr::DateTime> {
    static void format(mr::IOutStream& out, mr::DateTime time) {
        out.format(
            time.year, "-", mr::Int(time.month).pad(2, '0'), "-", mr::Int(time.day).pad(2, '0'), "T",
            mr::Int(time.hour).pad(2, '0'), ":", mr::Int(time.minute).pad(2, '0'), ":", mr::Int(time.second).pad(2, '0'), "Z"
        );
    }
};
