#pragma once

#include "apic.hpp"

#include <map>
#include <mutex>
#include <vector>

namespace mrtest {
    struct IcrWrite {
        uint32_t dst;
        uint32_t cmd;
    };

    /// @brief Register level local apic model.
    class FakeApic final : public mr::IApic {
        mutable std::mutex mLock;
        uint32_t mId;
        std::map<uint16_t, uint64_t> mRegisters;
        std::vector<IcrWrite> mIpis;
        std::vector<uint64_t> mDeadlines;
        size_t mEoiCount = 0;

        uint64_t read(uint16_t offset) const override {
            std::lock_guard guard(mLock);
            if (auto it = mRegisters.find(offset); it != mRegisters.end()) {
                return it->second;
            }

            return 0;
        }

        void write(uint16_t offset, uint64_t value) override {
            std::lock_guard guard(mLock);
            if (offset == mr::apic::kEndOfInt) {
                mEoiCount += 1;
            }

            mRegisters[offset] = value;
        }

        void writeIcr(uint32_t dst, uint32_t cmd) override {
            std::lock_guard guard(mLock);
            mIpis.push_back({ dst, cmd });
        }

    public:
        FakeApic(uint32_t id = 0)
            : mId(id)
        { }

        uint32_t id() const override { return mId; }

        void setTscDeadline(uint64_t deadline) noexcept override {
            std::lock_guard guard(mLock);
            mDeadlines.push_back(deadline);
        }

        uint64_t reg(uint16_t offset) const {
            return read(offset);
        }

        uint32_t lvt(mr::apic::Ivt ivt) const {
            return uint32_t(read(std::to_underlying(ivt)));
        }

        void setCurrentCount(uint64_t count) {
            write(mr::apic::kCurrentCount, count);
        }

        std::vector<IcrWrite> ipis() const {
            std::lock_guard guard(mLock);
            return mIpis;
        }

        std::vector<uint64_t> deadlines() const {
            std::lock_guard guard(mLock);
            return mDeadlines;
        }

        size_t eoiCount() const {
            std::lock_guard guard(mLock);
            return mEoiCount;
        }
    };

    /// @brief LVT timer mode field.
    constexpr uint32_t LvtTimerMode(uint32_t entry) {
        return (entry >> 17) & 0b11;
    }

    constexpr uint8_t LvtVector(uint32_t entry) {
        return entry & 0xFF;
    }

    /// @brief ICR delivery mode field.
    constexpr uint32_t IcrDeliveryMode(uint32_t cmd) {
        return (cmd >> 8) & 0b111;
    }

    /// @brief ICR destination shorthand field.
    constexpr uint32_t IcrShorthand(uint32_t cmd) {
        return (cmd >> 18) & 0b11;
    }
}
