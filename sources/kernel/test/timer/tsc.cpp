#include <gtest/gtest.h>

#include "fake_pit.hpp"

#include "timer/tsc_timer.hpp"

#include <atomic>
#include <latch>
#include <thread>

class TscCalibrationTest : public testing::Test {
public:
    mrtest::FakePit device;
    mrtest::ScopedPeripheral connection{&device};
    mr::IntervalTimer pit;
    mr::CalibratedFrequency frequency;
};

TEST_F(TscCalibrationTest, Uncalibrated) {
    EXPECT_FALSE(frequency.isCalibrated());
    EXPECT_EQ(mr::HertzValue(frequency.load()), 0);

    mr::InvariantTsc tsc(&frequency);
    uint64_t ticks = 0;
    EXPECT_EQ(mr::PeriodToTicks(mr::Period::millis(1), tsc.frequency(), &ticks), OsStatusNotCalibrated);
}

TEST_F(TscCalibrationTest, ThreeGigahertz) {
    // 3'000'000 ticks over the 1000us interval.
    mrtest::SteppingCounter counter(3'000'000);

    mr::hertz hz = mr::Hertz(0);
    ASSERT_EQ(mr::CalibrateTsc(pit, &counter, frequency, &hz), OsStatusSuccess);
    EXPECT_EQ(mr::HertzValue(hz), 3'000'000'000);
    EXPECT_EQ(mr::HertzValue(frequency.load()), 3'000'000'000);
    EXPECT_TRUE(frequency.isCalibrated());

    uint64_t ticks = 0;
    ASSERT_EQ(mr::PeriodToTicks(mr::Period::millis(1), frequency.load(), &ticks), OsStatusSuccess);
    EXPECT_EQ(ticks, 3'000'000);
}

TEST_F(TscCalibrationTest, SecondCallDoesNotMeasure) {
    mrtest::SteppingCounter counter(3'000'000);

    mr::hertz hz = mr::Hertz(0);
    ASSERT_EQ(mr::CalibrateTsc(pit, &counter, frequency, &hz), OsStatusSuccess);

    size_t accesses = device.portAccesses();
    uint64_t reads = counter.reads();

    mrtest::SteppingCounter other(1'000);
    mr::hertz second = mr::Hertz(0);
    ASSERT_EQ(mr::CalibrateTsc(pit, &other, frequency, &second), OsStatusSuccess);

    EXPECT_EQ(mr::HertzValue(second), 3'000'000'000);
    EXPECT_EQ(device.portAccesses(), accesses) << "No port IO after the frequency is published";
    EXPECT_EQ(counter.reads(), reads);
    EXPECT_EQ(other.reads(), 0);
}

TEST_F(TscCalibrationTest, ConcurrentCalibration) {
    static constexpr size_t kThreadCount = 8;
    mrtest::SteppingCounter counter(2'400'000);

    std::latch start(kThreadCount);
    std::vector<uint64_t> results(kThreadCount);
    std::vector<OsStatus> statuses(kThreadCount);

    {
        std::vector<std::jthread> threads;
        for (size_t i = 0; i < kThreadCount; i++) {
            threads.emplace_back([&, i] {
                start.arrive_and_wait();

                mr::hertz hz = mr::Hertz(0);
                statuses[i] = mr::CalibrateTsc(pit, &counter, frequency, &hz);
                results[i] = mr::HertzValue(hz);
            });
        }
    }

    for (size_t i = 0; i < kThreadCount; i++) {
        EXPECT_EQ(statuses[i], OsStatusSuccess) << "thread " << i;
        EXPECT_EQ(results[i], 2'400'000'000) << "thread " << i;
    }

    EXPECT_EQ(counter.reads(), 2) << "Exactly one measurement is taken";
    EXPECT_EQ(device.counts().size(), 1);
}

TEST_F(TscCalibrationTest, RetryAfterBadStatus) {
    mrtest::SteppingCounter counter(3'000'000);
    device.setFloating(true);

    mr::hertz hz = mr::Hertz(0);
    EXPECT_EQ(mr::CalibrateTsc(pit, &counter, frequency, &hz), OsStatusDeviceNotReady);
    EXPECT_EQ(device.counts().size(), mr::kCalibrationAttempts);
    EXPECT_FALSE(frequency.isCalibrated());
    EXPECT_EQ(mr::HertzValue(frequency.load()), 0);

    uint64_t ticks = 0;
    EXPECT_EQ(mr::PeriodToTicks(mr::Period::millis(1), frequency.load(), &ticks), OsStatusNotCalibrated);

    // The latch is left empty so a later call can succeed.
    device.setFloating(false);
    ASSERT_EQ(mr::CalibrateTsc(pit, &counter, frequency, &hz), OsStatusSuccess);
    EXPECT_EQ(mr::HertzValue(hz), 3'000'000'000);
}

TEST_F(TscCalibrationTest, DeadCounter) {
    mrtest::SteppingCounter counter(0);

    mr::hertz hz = mr::Hertz(0);
    EXPECT_EQ(mr::CalibrateTsc(pit, &counter, frequency, &hz), OsStatusDeviceNotReady);
    EXPECT_EQ(counter.reads(), 2 * mr::kCalibrationAttempts);
    EXPECT_FALSE(frequency.isCalibrated());
}

TEST_F(TscCalibrationTest, ReferenceClockBusy) {
    mrtest::SteppingCounter counter(3'000'000);
    device.hold(true);

    std::jthread sleeper([&] {
        ASSERT_EQ(pit.sleep(mr::Period::millis(1)), OsStatusSuccess);
    });

    while (!device.isProgrammed()) {
        std::this_thread::yield();
    }

    std::atomic<bool> done = false;
    OsStatus status = OsStatusInvalidData;
    mr::hertz hz = mr::Hertz(0);

    std::jthread calibrator([&] {
        status = mr::CalibrateTsc(pit, &counter, frequency, &hz);
        done = true;
    });

    // Far more polls than the attempt limit would allow if waiting consumed attempts.
    for (int i = 0; i < 10'000 && !done; i++) {
        std::this_thread::yield();
    }

    EXPECT_FALSE(done) << "Calibration gave up while the reference clock was busy";
    EXPECT_EQ(counter.reads(), 0);
    EXPECT_FALSE(frequency.isCalibrated());

    device.hold(false);
    sleeper.join();
    calibrator.join();

    ASSERT_EQ(status, OsStatusSuccess);
    EXPECT_EQ(mr::HertzValue(hz), 3'000'000'000);
    EXPECT_TRUE(frequency.isCalibrated());
}

TEST(CalibratedFrequencyTest, PublishOnce) {
    mr::CalibratedFrequency frequency;

    OsStatus status = frequency.publish([](uint64_t *hz) {
        *hz = 1'000;
        return OsStatusSuccess;
    });
    ASSERT_EQ(status, OsStatusSuccess);

    bool ran = false;
    status = frequency.publish([&](uint64_t *hz) {
        ran = true;
        *hz = 2'000;
        return OsStatusSuccess;
    });

    EXPECT_EQ(status, OsStatusCompleted);
    EXPECT_FALSE(ran);
    EXPECT_EQ(mr::HertzValue(frequency.load()), 1'000);
}
