#include <gtest/gtest.h>

#include "apic.hpp"

#include "fake_apic.hpp"

using namespace mr::apic;

class LocalApicTest : public testing::Test {
public:
    uint32_t at(uint16_t offset) const {
        return mmio[offset / sizeof(uint32_t)];
    }

    void set(uint16_t offset, uint32_t value) {
        mmio[offset / sizeof(uint32_t)] = value;
    }

    alignas(16) uint32_t mmio[0x1000 / sizeof(uint32_t)]{};
    mr::LocalApic apic{mmio};
};

TEST_F(LocalApicTest, Id) {
    set(0x20, 5 << 24);
    EXPECT_EQ(apic.id(), 5);
}

TEST_F(LocalApicTest, EndOfInterrupt) {
    set(0xB0, 0xFFFF'FFFF);
    apic.eoi();
    EXPECT_EQ(at(0xB0), 0);
}

TEST_F(LocalApicTest, SoftwareEnable) {
    set(0xF0, 0xFF);
    apic.setSpuriousVector(0x20);
    apic.enable();

    EXPECT_EQ(at(0xF0), 0x120);
    EXPECT_TRUE(at(0x80) & (1 << 4)) << "Task priority is raised while interrupts are routed";
}

TEST_F(LocalApicTest, TimerEntry) {
    apic.cfgIvtTimer({ .vector = 0x21, .timer = TimerMode::eDeadline });

    uint32_t entry = at(0x320);
    EXPECT_EQ(mrtest::LvtVector(entry), 0x21);
    EXPECT_EQ(mrtest::LvtTimerMode(entry), 0b10);
    EXPECT_FALSE(apic.isMasked(Ivt::eTimer));

    apic.mask(Ivt::eTimer);
    EXPECT_TRUE(at(0x320) & kLvtMask);
    EXPECT_EQ(mrtest::LvtVector(at(0x320)), 0x21);
}

TEST_F(LocalApicTest, ErrorEntry) {
    apic.cfgIvtError({ .vector = 0x22 });
    EXPECT_EQ(at(0x370), 0x22);

    // The timer mode field only exists in the timer entry.
    apic.cfgIvtError({ .vector = 0x22, .enabled = false, .timer = TimerMode::ePeriodic });
    EXPECT_EQ(at(0x370), 0x22 | kLvtMask);
}

TEST_F(LocalApicTest, TimerCountdown) {
    apic.setTimerDivisor(TimerDivide::e1);
    EXPECT_EQ(at(0x3E0), 0b1011);

    apic.setTimerDivisor(TimerDivide::e16);
    EXPECT_EQ(at(0x3E0), 0b0011);

    apic.setInitialCount(100'000);
    EXPECT_EQ(at(0x380), 100'000);

    set(0x390, 1234);
    EXPECT_EQ(apic.getCurrentCount(), 1234);
}

TEST_F(LocalApicTest, FixedIpi) {
    apic.sendIpi(3, IpiAlert { .vector = 0x24 });

    EXPECT_EQ(at(0x310), 3 << 24);
    EXPECT_EQ(at(0x300), 0x24 | (1 << 14));
}

TEST_F(LocalApicTest, NmiBroadcast) {
    apic.sendIpi(IcrDeliver::eOther, IpiAlert::nmi());

    uint32_t cmd = at(0x300);
    EXPECT_EQ(at(0x310), 0);
    EXPECT_EQ(mrtest::IcrDeliveryMode(cmd), 0b100);
    EXPECT_EQ(mrtest::IcrShorthand(cmd), 0b11);
    EXPECT_EQ(cmd & 0xFF, 0);
}
