#include "apic.hpp"

#include "arch/msr.hpp"

#include <bit>

static constexpr uint32_t kApicSoftwareEnable = (1 << 8);

// local apic methods

volatile uint32_t& mr::LocalApic::reg(uint16_t offset) const {
    return *std::bit_cast<volatile uint32_t*>(mBaseAddress + offset);
}

uint64_t mr::LocalApic::read(uint16_t offset) const {
    return reg(offset << 4);
}

void mr::LocalApic::write(uint16_t offset, uint64_t value) {
    reg(offset << 4) = value;
}

uint32_t mr::LocalApic::id() const {
    uint32_t id = reg(kApicId);
    return id >> 24;
}

void mr::LocalApic::writeIcr(uint32_t dst, uint32_t cmd) {
    reg(kIcr1) = dst << 24;
    reg(kIcr0) = cmd;
}

void mr::LocalApic::setTscDeadline(uint64_t deadline) noexcept MR_NONBLOCKING {
    x64::kTscDeadlineMsr.store(deadline);
}

// generic apic methods

uint32_t mr::detail::BuildIpi(apic::IpiAlert alert) {
    uint32_t result = 0;
    result |= alert.vector;
    result |= (std::to_underlying(alert.mode) << 8);
    result |= (std::to_underlying(alert.dst) << 11);
    result |= (std::to_underlying(alert.level) << 14);
    result |= (std::to_underlying(alert.trigger) << 15);
    return result;
}

uint32_t mr::detail::BuildIpiShorthand(apic::IpiAlert alert, apic::IcrDeliver deliver) {
    uint32_t result = BuildIpi(alert);
    result |= (std::to_underlying(deliver) << 18);
    return result;
}

void mr::IApic::sendIpi(uint32_t dst, apic::IpiAlert alert) {
    writeIcr(dst, detail::BuildIpi(alert));
}

void mr::IApic::sendIpi(apic::IcrDeliver deliver, apic::IpiAlert alert) {
    writeIcr(0, detail::BuildIpiShorthand(alert, deliver));
}

void mr::IApic::eoi() noexcept MR_NONBLOCKING {
    write(apic::kEndOfInt, 0);
}

void mr::IApic::maskTaskPriority() {
    static constexpr uint32_t kMaskTaskPriority = 1 << 4;
    uint32_t value = read(apic::kTaskPriority);
    value |= kMaskTaskPriority;
    write(apic::kTaskPriority, value);
}

void mr::IApic::configure(apic::Ivt ivt, apic::IvtConfig config) {
    uint32_t entry
        = config.vector
        | (std::to_underlying(config.polarity) << 13)
        | (std::to_underlying(config.trigger) << 15)
        | (config.enabled ? 0 : apic::kLvtMask);

    if (ivt == apic::Ivt::eTimer && config.timer != apic::TimerMode::eNone) {
        entry |= (std::to_underlying(config.timer) << 17);
    }

    write(std::to_underlying(ivt), entry);
}

void mr::IApic::mask(apic::Ivt ivt) {
    uint64_t value = read(std::to_underlying(ivt));
    write(std::to_underlying(ivt), value | apic::kLvtMask);
}

bool mr::IApic::isMasked(apic::Ivt ivt) const {
    return read(std::to_underlying(ivt)) & apic::kLvtMask;
}

void mr::IApic::setTimerDivisor(apic::TimerDivide timer) {
    auto v = std::to_underlying(timer);
    uint32_t value = (v & 0b11) | ((v & 0b100) << 1);
    write(apic::kDivide, value);
}

void mr::IApic::setInitialCount(uint64_t count) {
    write(apic::kInitialCount, count);
}

uint64_t mr::IApic::getCurrentCount() const {
    return read(apic::kCurrentCount);
}

void mr::IApic::enableSpuriousInt() {
    uint32_t value = read(apic::kSpuriousInt);
    value |= kApicSoftwareEnable;
    write(apic::kSpuriousInt, value);
}

void mr::IApic::enable() {
    maskTaskPriority();
    enableSpuriousInt();
}

void mr::IApic::setSpuriousVector(uint8_t vector) {
    uint32_t value = read(apic::kSpuriousInt);
    value = (value & ~0xFF) | vector;
    write(apic::kSpuriousInt, value);
}
