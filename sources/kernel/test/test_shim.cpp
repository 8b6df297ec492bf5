#include <gtest/gtest.h>

#include "panic.hpp"
#include "processor.hpp"

#include "test_shim.hpp"

#include <cstdlib>
#include <iostream>

static thread_local mr::CpuCoreId tCurrentCore = mr::CpuCoreId(0);

void mrtest::SetCurrentCore(mr::CpuCoreId core) {
    tCurrentCore = core;
}

void mr::InitCoreIdentity(CpuCoreId id) noexcept {
    tCurrentCore = id;
}

mr::CpuCoreId mr::GetCurrentCoreId() noexcept {
    return tCurrentCore;
}

void MrHalt(void) noexcept {
    std::cerr << "MrHalt called on core " << std::to_underlying(tCurrentCore) << std::endl;
    std::abort();
}

void mr::BugCheck(std::string_view message, std::source_location where) noexcept {
    std::cerr << "Bugcheck: " << message << " at " << where.file_name() << ":" << where.line() << std::endl;
    std::abort();
}
