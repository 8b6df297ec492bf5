#include "fault/coordinator.hpp"

#include "apic.hpp"
#include "panic.hpp"

#include "logger/categories.hpp"

static constinit std::atomic<mr::FaultCoordinator*> gFaultCoordinator = nullptr;

void mr::ApicFaultPlatform::broadcastNmi() noexcept {
    mApic->sendIpi(apic::IcrDeliver::eOther, apic::IpiAlert::nmi());
}

void mr::ApicFaultPlatform::halt() {
    MrHalt();
}

void mr::FaultCoordinator::bootstrapFailure(CpuCoreId core, std::string_view message, std::source_location where) {
    FaultLog.fatalf(core, " fault before fault handling was armed: ", message);
    FaultLog.fatalf("at ", where.file_name(), ":", where.line());
    mPlatform->halt();
}

mr::FaultTransition mr::FaultCoordinator::arm(CpuCoreId core) {
    FaultTransition result = mTable->arm(core);
    if (result != FaultTransition::eAdvanced) {
        FaultLog.warnf(core, " could not be armed, state: ", mTable->state(core));
        return result;
    }

    //
    // A core that panicked before this one armed did not know to wait for it,
    // but may still have broadcast before the NMI handler was ready. Join the fault here.
    //
    if (mTable->isFaultObserved()) {
        onFaultBroadcast(core);
    }

    return result;
}

void mr::FaultCoordinator::panic(CpuCoreId core, std::string_view message, std::source_location where) {
    if (!mTable->isLatched()) {
        bootstrapFailure(core, message, where);
    }

    switch (mTable->panic(core)) {
    case FaultTransition::eAdvanced:
        mPlatform->broadcastNmi();
        FaultLog.fatalf(core, " panic: ", message);
        FaultLog.fatalf("at ", where.file_name(), ":", where.line());
        mPlatform->halt();

    case FaultTransition::eAlreadyPanicked:
        // Nested fault while already stopping, the broadcast has been sent.
        mPlatform->halt();

    case FaultTransition::eRejected:
        break;
    }

    bootstrapFailure(core, message, where);
}

void mr::FaultCoordinator::onFaultBroadcast(CpuCoreId core) {
    // The result does not matter, the core stops in every case.
    (void)mTable->panic(core);
    mPlatform->halt();
}

void mr::SetFaultCoordinator(FaultCoordinator *coordinator) noexcept {
    gFaultCoordinator.store(coordinator);
}

mr::FaultCoordinator *mr::GetFaultCoordinator() noexcept {
    return gFaultCoordinator.load();
}
