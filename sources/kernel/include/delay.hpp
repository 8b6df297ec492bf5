#pragma once

#include "common/compiler/compiler.hpp"
#include "common/util/util.hpp"

#include <stdint.h>

namespace x64 {
    enum class PortDelay {
        eNone,
        ePostCode,
    };
}

// Port IO entry points. These are the only functions that touch IO ports,
// every device wraps its port pair in a capability object built on top of them.

void MrSetPortDelayMethod(x64::PortDelay delay) noexcept MR_BLOCKING;

WEAK_SYMBOL_TEST
void MrPortDelay(void) noexcept MR_BLOCKING;

void MrWriteByte(uint16_t port, uint8_t value) noexcept MR_BLOCKING;

WEAK_SYMBOL_TEST
uint8_t MrReadByte(uint16_t port) noexcept MR_BLOCKING;

WEAK_SYMBOL_TEST
void MrWriteByteNoDelay(uint16_t port, uint8_t value) noexcept MR_BLOCKING;
