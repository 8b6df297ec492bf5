#pragma once

#include <meridian/status.h>

#include "timer/pit.hpp"

#include "std/once.hpp"

namespace mr {
    /// @brief Length of the reference interval the fast counter is measured over.
    static constexpr Period kCalibrationInterval = Period::micros(1'000);

    /// @brief Number of reference intervals tried before calibration gives up.
    static constexpr unsigned kCalibrationAttempts = 8;

    /// @brief The frequency of the fast counter, published exactly once per boot.
    ///
    /// Zero is the uncalibrated sentinel and is what @a load returns until
    /// a measurement has been published.
    class CalibratedFrequency {
        stdx::Once<uint64_t> mFrequency;

    public:
        constexpr CalibratedFrequency() noexcept = default;

        /// @brief Run @p measure and publish its result if no frequency is published yet.
        ///
        /// @param measure Callable with the signature `OsStatus(uint64_t *hz)`.
        ///
        /// @retval OsStatusSuccess This call published the frequency.
        /// @retval OsStatusCompleted The frequency was already published, @p measure was not run.
        template<typename F>
        [[nodiscard]]
        OsStatus publish(F&& measure) {
            return mFrequency.initOnce(std::forward<F>(measure));
        }

        bool isCalibrated() const noexcept {
            return mFrequency.isReady();
        }

        hertz load() const noexcept MR_NONBLOCKING {
            if (const uint64_t *hz = mFrequency.get()) {
                return Hertz(*hz);
            }

            return Hertz(0);
        }
    };

    /// @brief The invariant timestamp counter of the current core.
    class InvariantTsc final : public ITickSource {
        const CalibratedFrequency *mFrequency;

    public:
        constexpr InvariantTsc(const CalibratedFrequency *frequency) noexcept
            : mFrequency(frequency)
        { }

        TickSourceType type() const override { return TickSourceType::TSC; }
        hertz frequency() const override { return mFrequency->load(); }
        uint64_t ticks() const override;
    };

    /// @brief Calibrate the fast counter against the interval timer.
    ///
    /// The first caller measures @p counter over @a kCalibrationInterval and publishes
    /// the result into @p frequency. Every later caller receives the published value
    /// without touching either device. Callers that arrive during the measurement wait for it.
    ///
    /// A reference clock held by another caller is waited on, only measurements that
    /// ran count towards @a kCalibrationAttempts.
    ///
    /// @param pit The reference clock.
    /// @param counter The fast counter to calibrate.
    /// @param frequency The latch the result is published through.
    /// @param result The published frequency.
    ///
    /// @retval OsStatusDeviceNotReady The reference clock or the fast counter did not respond.
    [[nodiscard]]
    OsStatus CalibrateTsc(IntervalTimer& pit, const ITickSource *counter, CalibratedFrequency& frequency, hertz *result);
}

template<>
struct mr::Format<mr::TickSourceType> {
    static void format(mr::IOutStream& out, mr::TickSourceType type) {
        switch (type) {
        case mr::TickSourceType::PIT8254: out.write("PIT"); break;
        case mr::TickSourceType::APIC: out.write("APIC"); break;
        case mr::TickSourceType::TSC: out.write("TSC"); break;
        }
    }
};
