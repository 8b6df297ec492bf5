#include <gtest/gtest.h>

#include "fake_pit.hpp"

#include "timer/pit.hpp"

#include <thread>

using namespace std::chrono_literals;

class PitTest : public testing::Test {
public:
    mrtest::FakePit device;
    mrtest::ScopedPeripheral connection{&device};
    mr::IntervalTimer pit;
};

TEST_F(PitTest, BestDivisor) {
    EXPECT_EQ(mr::IntervalTimer::bestDivisor(mr::Hertz(1'000)), 1193);
    EXPECT_EQ(mr::IntervalTimer::bestDivisor(mr::Hertz(100)), 11931);
    EXPECT_EQ(mr::IntervalTimer::bestDivisor(mr::Hertz(1)), 0xFFFF);
    EXPECT_EQ(mr::IntervalTimer::bestDivisor(mr::Hertz(10'000'000)), 1);
    EXPECT_EQ(mr::IntervalTimer::bestDivisor(mr::Hertz(0)), 0);
}

TEST_F(PitTest, SetFrequency) {
    EXPECT_EQ(mr::HertzValue(pit.frequency()), 0);

    pit.setFrequency(mr::Hertz(1'000));

    auto commands = device.commands();
    ASSERT_EQ(commands.size(), 1);
    EXPECT_EQ(commands[0], 0b0011'0100);

    auto counts = device.counts();
    ASSERT_EQ(counts.size(), 1);
    EXPECT_EQ(counts[0], 1193);

    EXPECT_EQ(mr::HertzValue(pit.frequency()), 1'193'182 / 1193);
}

TEST_F(PitTest, GetCount) {
    device.setCurrentCount(0x1234);
    EXPECT_EQ(pit.getCount(), 0x1234);
    EXPECT_EQ(device.commands().back(), 0b0000'0000);
}

TEST_F(PitTest, MeasureOneShot) {
    mrtest::SteppingCounter counter(500);

    uint64_t delta = 0;
    OsStatus status = pit.measure(mr::Period::micros(1000), &counter, &delta);
    ASSERT_EQ(status, OsStatusSuccess);
    EXPECT_EQ(delta, 500);
    EXPECT_EQ(counter.reads(), 2);

    auto commands = device.commands();
    ASSERT_GE(commands.size(), 2);
    EXPECT_EQ(commands[0], 0b0011'0000) << "The one shot must be programmed first";
    for (size_t i = 1; i < commands.size(); i++) {
        EXPECT_EQ(commands[i], 0b1110'0010) << "Only status read backs after programming";
    }

    EXPECT_EQ(commands.size() - 1, mrtest::FakePit::kPollsPerShot);

    auto counts = device.counts();
    ASSERT_EQ(counts.size(), 1);
    EXPECT_EQ(counts[0], 1193);
}

TEST_F(PitTest, MeasureRejectsLongInterval) {
    mrtest::SteppingCounter counter(500);

    uint64_t delta = 0;
    EXPECT_EQ(pit.measure(mr::Period::millis(100), &counter, &delta), OsStatusInvalidInput);
    EXPECT_EQ(pit.measure(mr::Period::zero(), &counter, &delta), OsStatusInvalidInput);
    EXPECT_EQ(device.portAccesses(), 0);
    EXPECT_EQ(counter.reads(), 0);
}

TEST_F(PitTest, MeasureFloatingBus) {
    mrtest::SteppingCounter counter(500);
    device.setFloating(true);

    uint64_t delta = 1234;
    EXPECT_EQ(pit.measure(mr::Period::micros(1000), &counter, &delta), OsStatusDeviceNotReady);
    EXPECT_EQ(delta, 1234);
}

TEST_F(PitTest, SleepSplitsIntoChunks) {
    // 100ms is 119318 pit ticks, more than one 16 bit count.
    ASSERT_EQ(pit.sleep(mr::Period::millis(100)), OsStatusSuccess);

    auto counts = device.counts();
    ASSERT_EQ(counts.size(), 2);
    EXPECT_EQ(counts[0], 0xFFFF);
    EXPECT_EQ(counts[1], 119318 - 0xFFFF);
}

TEST_F(PitTest, SleepResetsDivisor) {
    pit.setFrequency(mr::Hertz(1'000));
    ASSERT_EQ(pit.sleep(mr::Period::millis(1)), OsStatusSuccess);
    EXPECT_EQ(mr::HertzValue(pit.frequency()), 0);
}

TEST_F(PitTest, MeasureWhileBusy) {
    mrtest::SteppingCounter counter(500);
    device.hold(true);

    std::jthread sleeper([&] {
        ASSERT_EQ(pit.sleep(mr::Period::millis(1)), OsStatusSuccess);
    });

    while (!device.isProgrammed()) {
        std::this_thread::yield();
    }

    uint64_t delta = 0;
    EXPECT_EQ(pit.measure(mr::Period::micros(1000), &counter, &delta), OsStatusDeviceBusy);
    EXPECT_EQ(counter.reads(), 0);

    device.hold(false);
}
