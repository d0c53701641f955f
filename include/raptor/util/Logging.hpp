#pragma once

#include <string>
#include <string_view>

namespace raptor::util {

enum class LogLevel {
    trace,
    debug,
    info,
    warn,
    error
};

void initLogging(LogLevel level);
LogLevel logLevel();
bool shouldLog(LogLevel level);
void log(LogLevel level, const std::string& message);

const char* toString(LogLevel level);
// Unknown names fall back to info.
LogLevel parseLogLevel(std::string_view name);

} // namespace raptor::util
