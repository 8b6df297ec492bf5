#include "delay.hpp"

#include "arch/intrin.hpp"

/// @brief Port I/O delay interface.
/// Some chipsets need a short delay after a port write before the device
/// observes it, the delay method is picked once during boot.
using PortDelayCallback = void(*)() noexcept;

static void NullPortDelay() noexcept { }

/// @brief Port delay that functions by writing 0 to port 0x80.
/// The POST code port is unused after boot and writing to it forces the bus to settle.
static void PostCodePortDelay() noexcept {
    arch::Intrin::outbyte(0x80, 0);
}

static PortDelayCallback gPortDelay = NullPortDelay;

void MrSetPortDelayMethod(x64::PortDelay delay) noexcept MR_BLOCKING {
    switch (delay) {
    case x64::PortDelay::eNone:
        gPortDelay = NullPortDelay;
        break;
    case x64::PortDelay::ePostCode:
        gPortDelay = PostCodePortDelay;
        break;
    }
}

void MrPortDelay() noexcept MR_BLOCKING {
    gPortDelay();
}

uint8_t MrReadByte(uint16_t port) noexcept MR_BLOCKING {
    return arch::Intrin::inbyte(port);
}

void MrWriteByte(uint16_t port, uint8_t value) noexcept MR_BLOCKING {
    MrWriteByteNoDelay(port, value);
    MrPortDelay();
}

void MrWriteByteNoDelay(uint16_t port, uint8_t value) noexcept MR_BLOCKING {
    arch::Intrin::outbyte(port, value);
}
