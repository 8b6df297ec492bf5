#include "isr/vectors.hpp"

#include "logger/categories.hpp"

OsStatus mr::ValidateVectorTable(uint8_t minVector, uint8_t maxVector) noexcept {
    for (size_t i = 0; i < kInterruptVectorCount; i++) {
        const InterruptVectorInfo& info = kInterruptVectors[i];
        uint8_t vector = VectorNumber(info.vector);

        if (vector != kVectorBase + i) {
            IsrLog.errorf(info.name, " is not consecutive from the vector base");
            return OsStatusInvalidData;
        }

        if (vector < kVectorBase) {
            IsrLog.errorf(info.vector, " overlaps the exception vectors");
            return OsStatusInvalidData;
        }

        if (vector < minVector || vector > maxVector) {
            IsrLog.errorf(info.vector, " is outside of the deliverable range ", mr::Hex(minVector).pad(2), "-", mr::Hex(maxVector).pad(2));
            return OsStatusOutOfBounds;
        }
    }

    return OsStatusSuccess;
}
