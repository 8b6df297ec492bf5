#pragma once

#include "util/format.hpp"

#include "common/compiler/compiler.hpp"

// workaround for clang bug, nodiscard in a requires clause triggers a warning
DIAGNOSTIC_BEGIN_IGNORE("-Wunused-result")

#include <mp-units/systems/si.h> // IWYU pragma: export

DIAGNOSTIC_END_IGNORE()

namespace mp = mp_units;

namespace si {
    using namespace mp_units::si;
}

namespace mr {
    using hertz = mp::quantity<si::hertz, uint64_t>;

    constexpr hertz Hertz(uint64_t value) noexcept {
        return value * si::hertz;
    }

    constexpr uint64_t HertzValue(hertz value) noexcept {
        return value.numerical_value_in(si::hertz);
    }
}

template<>
struct mr::Format<mr::hertz> {
    static void format(mr::IOutStream& out, mr::hertz value) {
        static constexpr uint64_t kMhz = 1'000'000;
        uint64_t count = mr::HertzValue(value);
        if (count > kMhz) {
            out.format(count / kMhz, ".", mr::Int(count % kMhz).pad(6), " MHz");
        } else {
            out.format(count, " Hz");
        }
    }
};
