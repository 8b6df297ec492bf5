#include "cmos.hpp"

#include "delay.hpp"

#include "logger/categories.hpp"

using CalendarClock = mr::CalendarClock;

// Bit 7 of the index port masks NMIs, it must stay clear so fault broadcasts are delivered.
static constexpr uint8_t kRegisterMask = 0x7F;

static void DateComponentOverflow(uint8_t& value, uint8_t& next, uint8_t max) {
    if (value >= max) {
        value -= max;
        next += 1;
    }
}

mr::DateTime mr::detail::ConvertCmosToDate(CmosRegisters registers) {
    auto [regB, second, minute, hour, day, month, year, century] = registers;

    bool is12Hour = regB & k12HourClock;
    bool isBcdFormat = !(regB & kBinaryMode);
    bool isPm = hour & kPmHour;

    hour &= ~kPmHour;

    if (isBcdFormat) {
        second = ConvertFromBcd(second);
        minute = ConvertFromBcd(minute);
        hour = ConvertFromBcd(hour);
        day = ConvertFromBcd(day);
        month = ConvertFromBcd(month);
        year = ConvertFromBcd(year);
    }

    if (is12Hour) {
        // 12am is midnight and 12pm is noon.
        hour = (hour % 12) + (isPm ? 12 : 0);
    }

    DateComponentOverflow(second, minute, 60);
    DateComponentOverflow(minute, hour, 60);
    DateComponentOverflow(hour, day, 24);

    if (century != 0) {
        if (isBcdFormat)
            century = ConvertFromBcd(century);

        year += century * 100;
    } else {
        year += kDefaultYear;
    }

    return DateTime {
        .second = second,
        .minute = minute,
        .hour = hour,
        .day = day,
        .month = month,
        .year = year,
    };
}

uint8_t CalendarClock::readRegister(uint8_t reg) {
    MrWriteByte(kIndex, reg & kRegisterMask);
    return MrReadByte(kData);
}

mr::detail::CmosRegisters CalendarClock::readRegisters() {
    return detail::CmosRegisters {
        .regB = readRegister(kStatusB),
        .second = readRegister(kSeconds),
        .minute = readRegister(kMinutes),
        .hour = readRegister(kHours),
        .day = readRegister(kDay),
        .month = readRegister(kMonth),
        .year = readRegister(kYear),
        .century = (mCenturyRegister != 0)
            ? readRegister(mCenturyRegister)
            : uint8_t(0),
    };
}

mr::DateTime CalendarClock::read() {
    detail::CmosRegisters registers;

    {
        stdx::LockGuard guard(mLock);
        registers = readRegisters();
    }

    DateTime date = detail::ConvertCmosToDate(registers);
    ClockLog.dbgf("Calendar clock: ", date);
    return date;
}
