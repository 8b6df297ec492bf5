#include "isr/isr.hpp"

#include "logger/categories.hpp"

static constinit std::atomic<mr::IsrTable*> gIsrTable = nullptr;

mr::IsrTable::IsrTable() noexcept {
    for (IsrEntry& entry : mHandlers) {
        entry.store(DefaultIsrHandler, std::memory_order_relaxed);
    }
}

mr::IsrCallback mr::IsrTable::install(uint8_t isr, IsrCallback callback) noexcept {
    if (isr >= kCount) {
        IsrLog.errorf("Vector ", mr::Hex(isr).pad(2), " is outside of the shared table");
        return nullptr;
    }

    return mHandlers[isr].exchange(callback != nullptr ? callback : DefaultIsrHandler);
}

bool mr::IsrTable::isInstalled(uint8_t isr) const noexcept {
    return isr < kCount && mHandlers[isr].load() != DefaultIsrHandler;
}

mr::IsrContext mr::IsrTable::invoke(IsrContext *context) noexcept {
    uint8_t vector = uint8_t(context->vector);
    if (vector >= kCount) {
        return DefaultIsrHandler(context);
    }

    IsrCallback isr = mHandlers[vector].load();
    return isr(context);
}

OsStatus mr::BuildDispatchTable(IsrTable& table, std::span<const VectorBinding> bindings, uint8_t minVector, uint8_t maxVector) {
    if (OsStatus status = ValidateVectorTable(minVector, maxVector)) {
        return status;
    }

    bool seen[kInterruptVectorCount] = {};
    for (const VectorBinding& binding : bindings) {
        size_t index = VectorIndex(binding.vector);
        if (seen[index]) {
            IsrLog.errorf("Duplicate handler for ", binding.vector);
            return OsStatusAlreadyExists;
        }

        seen[index] = true;
    }

    for (const VectorBinding& binding : bindings) {
        table.install(binding.vector, binding.callback);
    }

    return OsStatusSuccess;
}

void mr::SetIsrTable(IsrTable *table) noexcept {
    gIsrTable.store(table);
}

mr::IsrTable *mr::GetIsrTable() noexcept {
    return gIsrTable.load();
}

extern "C" mr::IsrContext MrIsrDispatchRoutine(mr::IsrContext *context) noexcept {
    if (mr::IsrTable *table = mr::GetIsrTable()) {
        return table->invoke(context);
    }

    return mr::DefaultIsrHandler(context);
}
