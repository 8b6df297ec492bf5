#include "isr/isr.hpp"

#include "logger/categories.hpp"

mr::IsrContext mr::DefaultIsrHandler(mr::IsrContext *context) noexcept {
    IsrLog.warnf("Unhandled interrupt: ", mr::Hex(context->vector).pad(2), " Error: ", uint64_t(context->error), " RIP: ", mr::Hex(context->rip));
    return *context;
}
