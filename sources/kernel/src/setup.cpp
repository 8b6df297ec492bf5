#include "setup.hpp"

#include "apic.hpp"
#include "fault/coordinator.hpp"
#include "isr/isr.hpp"
#include "memory/frame_allocator.hpp"
#include "timer/local_timer.hpp"
#include "timer/tsc_timer.hpp"

#include "logger/categories.hpp"
#include "panic.hpp"

static constinit std::atomic<mr::BootContext*> gBootContext = nullptr;

static mr::CoreContext *GetCoreContext(mr::CpuCoreId core) {
    mr::BootContext *context = mr::GetBootContext();
    if (context == nullptr) {
        return nullptr;
    }

    size_t index = std::to_underlying(core);
    if (index >= context->cores.size()) {
        return nullptr;
    }

    return &context->cores[index];
}

static mr::IsrContext FaultNmiHandler(mr::IsrContext *context) {
    mr::BootContext *boot = mr::GetBootContext();
    if (boot != nullptr && boot->coordinator != nullptr) {
        boot->coordinator->onFaultBroadcast(mr::GetCurrentCoreId());
    }

    return *context;
}

static mr::IsrContext LocalTimerHandler(mr::IsrContext *context) {
    if (mr::CoreContext *core = GetCoreContext(mr::GetCurrentCoreId())) {
        if (core->timer != nullptr) {
            core->timer->onTimerInterrupt();
        }

        core->apic->eoi();
    }

    return *context;
}

static mr::IsrContext LocalErrorHandler(mr::IsrContext *context) {
    IsrLog.errorf("Local APIC error on ", mr::GetCurrentCoreId());

    if (mr::CoreContext *core = GetCoreContext(mr::GetCurrentCoreId())) {
        core->apic->eoi();
    }

    return *context;
}

static mr::IsrContext SpuriousHandler(mr::IsrContext *context) {
    // Spurious interrupts are not acknowledged.
    return *context;
}

static constexpr mr::VectorBinding kSharedBindings[] = {
    { mr::InterruptVector::eSpurious, SpuriousHandler },
    { mr::InterruptVector::eLocalTimer, LocalTimerHandler },
    { mr::InterruptVector::eLocalError, LocalErrorHandler },
};

void mr::SetBootContext(BootContext *context) noexcept {
    gBootContext.store(context);
}

mr::BootContext *mr::GetBootContext() noexcept {
    return gBootContext.load();
}

OsStatus mr::InitSystem(BootContext& context, std::span<const boot::MemoryRegion> memmap) {
    MR_CHECK(context.pit != nullptr && context.frequency != nullptr && context.counter != nullptr,
             "Boot context has no reference clock");
    MR_CHECK(context.faults != nullptr && context.coordinator != nullptr && context.memory != nullptr && context.isrs != nullptr,
             "Boot context is missing a shared subsystem");

    if (context.cores.empty()) {
        InitLog.fatalf("No cores were enumerated");
        return OsStatusInvalidInput;
    }

    if (OsStatus status = FrameAllocator::create(memmap, context.memory)) {
        InitLog.fatalf("Failed to build the frame allocator: ", OsStatusId(status));
        return status;
    }

    CpuCoreCount count = CpuCoreCount(context.cores.size());
    if (OsStatus status = context.faults->latch(count)) {
        if (status != OsStatusCompleted) {
            InitLog.fatalf("Failed to create the fault table for ", count, " cores: ", OsStatusId(status));
            return status;
        }
    }

    if (OsStatus status = BuildDispatchTable(*context.isrs, kSharedBindings, apic::kMinVector, apic::kMaxVector)) {
        InitLog.fatalf("Failed to build the dispatch table: ", OsStatusId(status));
        return status;
    }

    SetIsrTable(context.isrs);
    SetFaultCoordinator(context.coordinator);
    SetBootContext(&context);

    FrameAllocatorStats stats = context.memory->stats();
    InitLog.infof(count, " cores, ", stats.usage(MemoryType::eFree) / x64::kPageSize, " free frames");

    return OsStatusSuccess;
}

OsStatus mr::InitCore(BootContext& context, CpuCoreId core, IApic *apic, LocalTickTimer *timer) {
    size_t index = std::to_underlying(core);
    if (index >= context.cores.size()) {
        InitLog.errorf(core, " was not enumerated");
        return OsStatusOutOfBounds;
    }

    MR_CHECK(apic != nullptr && timer != nullptr, "Core brought up without its local devices");

    InitCoreIdentity(core);
    context.cores[index] = CoreContext { apic, timer };

    // The fault entry must be in place before the core is armed.
    context.isrs->install(isr::NMI, FaultNmiHandler);

    // The apic's own interrupt sources are delivered on the shared vectors.
    apic->setSpuriousVector(VectorNumber(InterruptVector::eSpurious));
    apic->cfgIvtError({ .vector = VectorNumber(InterruptVector::eLocalError) });
    apic->enable();

    if (context.coordinator->arm(core) != FaultTransition::eAdvanced) {
        InitLog.errorf(core, " could not be armed for faults");
        return OsStatusNotAvailable;
    }

    hertz frequency = Hertz(0);
    if (OsStatus status = CalibrateTsc(*context.pit, context.counter, *context.frequency, &frequency)) {
        InitLog.errorf(core, " has no calibrated counter: ", OsStatusId(status));
        return OsStatusNotCalibrated;
    }

    if (OsStatus status = timer->armPeriodicTick()) {
        return status;
    }

    InitLog.infof(core, " online, counter frequency ", frequency);
    return OsStatusSuccess;
}
