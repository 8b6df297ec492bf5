#pragma once

#include "util/format.hpp"

#include <utility>

#include <stdint.h>

namespace mr {
    namespace apic {
        enum class IcrDeliver : uint32_t {
            eSingle = 0b00,
            eSelf = 0b01,
            eAll = 0b10,
            eOther = 0b11,
        };

        enum class IcrMode : uint32_t {
            eFixed = 0b000,
            eLowest = 0b001,
            eSmi = 0b010,
            eNmi = 0b100,
            eInit = 0b101,
            eStartup = 0b110,
        };

        enum class Ivt : uint16_t {
            eTimer = 0x32,
            eThermal = 0x33,
            ePerformance = 0x34,
            eLvt0 = 0x35,
            eLvt1 = 0x36,
            eError = 0x37,
        };

        enum class Polarity : uint32_t {
            eActiveHigh = 0,
            eActiveLow = 1,
        };

        enum class Trigger : uint32_t {
            eEdge = 0,
            eLevel = 1,
        };

        enum class DestinationMode : uint32_t {
            ePhysical = 0,
            eLogical = 1,
        };

        enum class Level : uint32_t {
            eDeAssert = 0,
            eAssert = 1,
        };

        enum class TimerMode {
            eOneShot = 0b00,
            ePeriodic = 0b01,
            eDeadline = 0b10,
            eNone = 0b11
        };

        struct IvtConfig {
            uint8_t vector;
            Polarity polarity = Polarity::eActiveHigh;
            Trigger trigger = Trigger::eEdge;
            bool enabled = true;
            TimerMode timer = TimerMode::eNone;
        };

        struct IpiAlert {
            uint8_t vector;
            IcrMode mode = IcrMode::eFixed;
            DestinationMode dst = DestinationMode::ePhysical;
            Trigger trigger = Trigger::eEdge;
            Level level = Level::eAssert;

            /// @brief The NMI delivery mode ignores the vector field.
            static constexpr IpiAlert nmi() {
                return IpiAlert {
                    .vector = 0,
                    .mode = IcrMode::eNmi,
                };
            }
        };

        enum class TimerDivide {
            e1 = 0b111,
            e2 = 0b000,
            e4 = 0b001,
            e8 = 0b010,
            e16 = 0b011,
            e32 = 0b100,
            e64 = 0b101,
            e128 = 0b110,
        };

        // apic register offsets

        static constexpr uint16_t kTaskPriority = 0x8;
        static constexpr uint16_t kEndOfInt = 0xb;
        static constexpr uint16_t kSpuriousInt = 0xf;

        static constexpr uint16_t kIcr0 = 0x30;
        static constexpr uint16_t kIcr1 = 0x31;

        static constexpr uint16_t kInitialCount = 0x38;
        static constexpr uint16_t kCurrentCount = 0x39;

        static constexpr uint16_t kDivide = 0x3e;

        /// @brief Set in an LVT entry to mask the interrupt source.
        static constexpr uint32_t kLvtMask = (1 << 16);

        /// @brief Lowest vector the local apic will deliver without raising an illegal vector error.
        static constexpr uint8_t kMinVector = 0x10;
        static constexpr uint8_t kMaxVector = 0xFF;
    }

    class IApic {
        void maskTaskPriority();
        void enableSpuriousInt();

        virtual void writeIcr(uint32_t dst, uint32_t cmd) = 0;

        virtual uint64_t read(uint16_t offset) const = 0;
        virtual void write(uint16_t offset, uint64_t value) = 0;

    public:
        virtual ~IApic() = default;

        virtual uint32_t id() const = 0;

        /// @brief Write the absolute IA32_TSC_DEADLINE target, zero disarms the timer.
        virtual void setTscDeadline(uint64_t deadline) noexcept MR_NONBLOCKING = 0;

        void sendIpi(uint32_t dst, apic::IpiAlert alert);
        void sendIpi(apic::IcrDeliver deliver, apic::IpiAlert alert);

        void configure(apic::Ivt ivt, apic::IvtConfig config);
        void mask(apic::Ivt ivt);
        bool isMasked(apic::Ivt ivt) const;

        void cfgIvtTimer(apic::IvtConfig config) { configure(apic::Ivt::eTimer, config); }
        void cfgIvtError(apic::IvtConfig config) { configure(apic::Ivt::eError, config); }

        void setTimerDivisor(apic::TimerDivide timer);

        void setInitialCount(uint64_t count);
        uint64_t getCurrentCount() const;

        void eoi() noexcept MR_NONBLOCKING;

        void enable();

        void setSpuriousVector(uint8_t vector);
    };

    class LocalApic final : public IApic {
        static constexpr uint16_t kApicId = 0x20;

        static constexpr uint32_t kIcr1 = 0x310;
        static constexpr uint32_t kIcr0 = 0x300;

        uint8_t *mBaseAddress = nullptr;

        volatile uint32_t& reg(uint16_t offset) const;

        uint64_t read(uint16_t offset) const override;
        void write(uint16_t offset, uint64_t value) override;

        void writeIcr(uint32_t dst, uint32_t cmd) override;

    public:
        constexpr LocalApic() = default;

        /// @param base The virtual address the apic mmio region is mapped at, must be mapped uncached.
        LocalApic(void *base)
            : mBaseAddress(static_cast<uint8_t*>(base))
        { }

        uint32_t id() const override;

        void setTscDeadline(uint64_t deadline) noexcept MR_NONBLOCKING override;
    };

    namespace detail {
        uint32_t BuildIpi(apic::IpiAlert alert);
        uint32_t BuildIpiShorthand(apic::IpiAlert alert, apic::IcrDeliver deliver);
    }
}
