#include <gtest/gtest.h>

#include "fake_apic.hpp"
#include "fake_pit.hpp"

#include "timer/apic_timer.hpp"
#include "timer/local_timer.hpp"

#include "isr/vectors.hpp"

using mr::apic::Ivt;

class LocalTimerTest : public testing::Test {
public:
    mrtest::FakeApic apic;
    mrtest::SteppingCounter tsc{100, 10'000, mr::Hertz(3'000'000'000)};
};

TEST_F(LocalTimerTest, ArmPeriodicTick) {
    mr::LocalTickTimer timer(&apic, &tsc);
    ASSERT_EQ(timer.armPeriodicTick(), OsStatusSuccess);

    EXPECT_EQ(timer.mode(), mr::TickMode::eDeadline);
    EXPECT_EQ(timer.quantum(), 3'000'000);

    uint32_t lvt = apic.lvt(Ivt::eTimer);
    EXPECT_EQ(mrtest::LvtVector(lvt), 0x21);
    EXPECT_EQ(mrtest::LvtTimerMode(lvt), std::to_underlying(mr::apic::TimerMode::eDeadline));
    EXPECT_FALSE(lvt & mr::apic::kLvtMask);
    EXPECT_TRUE(apic.isMasked(Ivt::eThermal));

    auto deadlines = apic.deadlines();
    ASSERT_EQ(deadlines.size(), 1);
    EXPECT_EQ(deadlines[0], 10'000 + 3'000'000);
    EXPECT_EQ(timer.deadline(), deadlines[0]);
}

TEST_F(LocalTimerTest, ArmUncalibrated) {
    mrtest::SteppingCounter uncalibrated{100};
    mr::LocalTickTimer timer(&apic, &uncalibrated);

    EXPECT_EQ(timer.armPeriodicTick(), OsStatusNotCalibrated);
    EXPECT_EQ(timer.mode(), mr::TickMode::eDisabled);
    EXPECT_TRUE(apic.deadlines().empty());
    EXPECT_EQ(uncalibrated.reads(), 0);
}

TEST_F(LocalTimerTest, InterruptRearmsDeadline) {
    mr::LocalTickTimer timer(&apic, &tsc);
    ASSERT_EQ(timer.armPeriodicTick(), OsStatusSuccess);

    for (int i = 0; i < 5; i++) {
        timer.onTimerInterrupt();
    }

    EXPECT_EQ(timer.tickCount(), 5);

    auto deadlines = apic.deadlines();
    ASSERT_EQ(deadlines.size(), 6);
    for (size_t i = 1; i < deadlines.size(); i++) {
        EXPECT_GT(deadlines[i], deadlines[i - 1]);
        EXPECT_EQ(deadlines[i] - deadlines[i - 1], 100) << "One counter step between each rearm";
    }

    EXPECT_EQ(apic.eoiCount(), 0) << "End of interrupt is signalled by the isr, not the timer";
}

TEST_F(LocalTimerTest, Disable) {
    mr::LocalTickTimer timer(&apic, &tsc);
    ASSERT_EQ(timer.armPeriodicTick(), OsStatusSuccess);

    timer.disable();
    EXPECT_EQ(timer.mode(), mr::TickMode::eDisabled);
    EXPECT_TRUE(apic.lvt(Ivt::eTimer) & mr::apic::kLvtMask);
    EXPECT_EQ(apic.deadlines().back(), 0);

    timer.onTimerInterrupt();
    EXPECT_EQ(apic.deadlines().size(), 2) << "A disabled timer does not rearm";
}

TEST_F(LocalTimerTest, OneShotWithoutApicTimer) {
    mr::LocalTickTimer timer(&apic, &tsc);
    EXPECT_EQ(timer.armOneShot(mr::Period::millis(1)), OsStatusNotSupported);
    EXPECT_EQ(timer.armLegacyPeriodic(mr::Period::millis(1)), OsStatusNotSupported);
}

class ApicTimerTest : public LocalTimerTest {
public:
    mrtest::FakePit device;
    mrtest::ScopedPeripheral connection{&device};
    mr::IntervalTimer pit;
};

TEST_F(ApicTimerTest, Train) {
    // Every 10ms sleep leaves the countdown 1'000'000 below its start.
    apic.setCurrentCount(UINT32_MAX - 1'000'000);

    mr::ApicTimer apicTimer;
    ASSERT_EQ(mr::TrainApicTimer(&apic, pit, &apicTimer), OsStatusSuccess);
    EXPECT_EQ(mr::HertzValue(apicTimer.frequency()), 100'000'000);
    EXPECT_EQ(apic.reg(mr::apic::kInitialCount), 0) << "Timer is stopped after training";
}

TEST_F(ApicTimerTest, OneShot) {
    apic.setCurrentCount(UINT32_MAX - 1'000'000);

    mr::ApicTimer apicTimer;
    ASSERT_EQ(mr::TrainApicTimer(&apic, pit, &apicTimer), OsStatusSuccess);

    mr::LocalTickTimer timer(&apic, &tsc, &apicTimer);
    ASSERT_EQ(timer.armOneShot(mr::Period::millis(1)), OsStatusSuccess);

    EXPECT_EQ(timer.mode(), mr::TickMode::eOneShot);
    EXPECT_EQ(apic.reg(mr::apic::kInitialCount), 100'000);
    EXPECT_EQ(mrtest::LvtTimerMode(apic.lvt(Ivt::eTimer)), std::to_underlying(mr::apic::TimerMode::eOneShot));

    timer.onTimerInterrupt();
    EXPECT_EQ(timer.mode(), mr::TickMode::eDisabled);
    EXPECT_EQ(timer.tickCount(), 1);
}

TEST_F(ApicTimerTest, LegacyPeriodic) {
    apic.setCurrentCount(UINT32_MAX - 1'000'000);

    mr::ApicTimer apicTimer;
    ASSERT_EQ(mr::TrainApicTimer(&apic, pit, &apicTimer), OsStatusSuccess);

    mr::LocalTickTimer timer(&apic, &tsc, &apicTimer);
    ASSERT_EQ(timer.armLegacyPeriodic(mr::Period::millis(10)), OsStatusSuccess);
    EXPECT_EQ(apic.reg(mr::apic::kInitialCount), 1'000'000);
    EXPECT_EQ(mrtest::LvtTimerMode(apic.lvt(Ivt::eTimer)), std::to_underlying(mr::apic::TimerMode::ePeriodic));

    timer.onTimerInterrupt();
    timer.onTimerInterrupt();
    EXPECT_EQ(timer.mode(), mr::TickMode::ePeriodic);
    EXPECT_EQ(timer.tickCount(), 2);

    EXPECT_EQ(timer.armLegacyPeriodic(mr::Period::fromRaw(UINT64_MAX / 2)), OsStatusOutOfBounds);
}
