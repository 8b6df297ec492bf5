#pragma once

#include "logger/logger.hpp"

inline mr::Logger InitLog { "INIT" };
inline mr::Logger ClockLog { "CLOCK" };
inline mr::Logger TimerLog { "TIMER" };
inline mr::Logger IsrLog { "ISR" };
inline mr::Logger MemLog { "MEMORY" };
inline mr::Logger FaultLog { "FAULT" };
