#include "logger/e9_appender.hpp"
#include "logger/logger.hpp"

#include "delay.hpp"

static void WriteString(std::string_view text) {
    for (char c : text) {
        MrWriteByteNoDelay(mr::E9Appender::kLogPort, c);
    }
}

static std::string_view LevelName(mr::LogLevel level) {
    switch (level) {
    case mr::LogLevel::eDebug: return "DEBUG";
    case mr::LogLevel::eInfo: return "INFO";
    case mr::LogLevel::eWarning: return "WARN";
    case mr::LogLevel::eError: return "ERROR";
    case mr::LogLevel::eFatal: return "FATAL";
    }

    return "UNKNOWN";
}

void mr::E9Appender::write(const LogMessageView& message) {
    WriteString("[");
    WriteString(message.logger->getName());
    WriteString(":");
    WriteString(LevelName(message.level));
    WriteString("] ");
    WriteString(message.message);
    MrWriteByteNoDelay(kLogPort, '\n');
}

bool mr::E9Appender::isAvailable() noexcept {
    return MrReadByte(kLogPort) == kLogPort;
}
