#include "fault/fault_state.hpp"

#include <new>

static mr::CoreFaultState Predecessor(mr::CoreFaultState state) {
    switch (state) {
    case mr::CoreFaultState::eArmed:
        return mr::CoreFaultState::eNotArmed;
    case mr::CoreFaultState::ePanicked:
        return mr::CoreFaultState::eArmed;
    case mr::CoreFaultState::eNotArmed:
        break;
    }

    return state;
}

mr::FaultTransition mr::AdvanceFaultState(FaultCell& cell, CoreFaultState to) noexcept MR_NONBLOCKING {
    if (to == CoreFaultState::eNotArmed) {
        return FaultTransition::eRejected;
    }

    CoreFaultState expected = Predecessor(to);
    if (cell.compare_exchange_strong(expected, to, std::memory_order_seq_cst)) {
        return FaultTransition::eAdvanced;
    }

    if (expected == CoreFaultState::ePanicked) {
        return FaultTransition::eAlreadyPanicked;
    }

    return FaultTransition::eRejected;
}

mr::FaultCell *mr::FaultStateTable::cell(CpuCoreId core) const noexcept MR_NONBLOCKING {
    const Storage *storage = mStorage.get();
    if (storage == nullptr) {
        return nullptr;
    }

    CpuCoreCount index = std::to_underlying(core);
    if (index >= storage->count) {
        return nullptr;
    }

    return &storage->cells[index];
}

OsStatus mr::FaultStateTable::latch(CpuCoreCount count) {
    if (count == 0) {
        return OsStatusInvalidInput;
    }

    return mStorage.initOnce([&](Storage *storage) {
        FaultCell *cells = new (std::nothrow) FaultCell[count]();
        if (cells == nullptr) {
            return OsStatusOutOfMemory;
        }

        storage->cells.reset(cells);
        storage->count = count;
        return OsStatusSuccess;
    });
}

mr::CpuCoreCount mr::FaultStateTable::count() const noexcept MR_NONBLOCKING {
    const Storage *storage = mStorage.get();
    return storage ? storage->count : 0;
}

mr::FaultTransition mr::FaultStateTable::arm(CpuCoreId core) noexcept MR_NONBLOCKING {
    FaultCell *it = cell(core);
    if (it == nullptr) {
        return FaultTransition::eRejected;
    }

    return AdvanceFaultState(*it, CoreFaultState::eArmed);
}

mr::FaultTransition mr::FaultStateTable::panic(CpuCoreId core) noexcept MR_NONBLOCKING {
    FaultCell *it = cell(core);
    if (it == nullptr) {
        return FaultTransition::eRejected;
    }

    FaultTransition result = AdvanceFaultState(*it, CoreFaultState::ePanicked);
    if (result == FaultTransition::eAdvanced) {
        mFaultObserved.store(true, std::memory_order_seq_cst);
    }

    return result;
}

mr::CoreFaultState mr::FaultStateTable::state(CpuCoreId core) const noexcept MR_NONBLOCKING {
    FaultCell *it = cell(core);
    if (it == nullptr) {
        return CoreFaultState::eNotArmed;
    }

    return it->load(std::memory_order_seq_cst);
}
