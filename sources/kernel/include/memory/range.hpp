#pragma once

#include "common/physical_address.hpp"
#include "common/range.hpp"

#include "util/format.hpp"

namespace x64 {
    static constexpr size_t kPageSize = 0x1000;
}

namespace mr {
    using MemoryRange = sm::AnyRange<sm::PhysicalAddress>;
}

template<>
struct mr::Format<sm::PhysicalAddress> {
    static void format(mr::IOutStream& out, sm::PhysicalAddress value) {
        out.format(mr::Hex(value.address).pad(16));
    }
};

template<>
struct mr::Format<mr::MemoryRange> {
    static void format(mr::IOutStream& out, mr::MemoryRange value) {
        out.format("[", value.front, "-", value.back, "]");
    }
};
