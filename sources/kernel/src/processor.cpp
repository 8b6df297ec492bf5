#include "processor.hpp"

#include "arch/intrin.hpp"
#include "arch/msr.hpp"

void mr::InitCoreIdentity(CpuCoreId id) noexcept {
    x64::kTscAuxMsr.store(std::to_underlying(id));
}

mr::CpuCoreId mr::GetCurrentCoreId() noexcept {
    uint32_t aux;
    (void)arch::Intrin::rdtscp(&aux);
    return CpuCoreId(aux);
}
