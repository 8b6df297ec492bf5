#include "panic.hpp"

#include "arch/intrin.hpp"
#include "fault/coordinator.hpp"
#include "logger/categories.hpp"
#include "processor.hpp"

[[noreturn]]
void MrHalt(void) noexcept {
    for (;;) {
        arch::Intrin::cli();
        arch::Intrin::halt();
    }
}

void mr::detail::RaiseBugCheck(std::string_view message, std::source_location where) {
    if (FaultCoordinator *coordinator = GetFaultCoordinator()) {
        coordinator->panic(GetCurrentCoreId(), message, where);
    }

    InitLog.fatalf("Assertion failed '", message, "'");
    InitLog.fatalf(where.function_name(), " (", where.file_name(), ":", where.line(), ")");
    MrHalt();
}

void mr::BugCheck(std::string_view message, std::source_location where) noexcept {
    detail::RaiseBugCheck(message, where);
}
