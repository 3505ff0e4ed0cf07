#pragma once
#include <functional>
#include <string_view>

namespace kr {

enum class LogLevel { Debug, Info, Warn, Error };

using LogSink = std::function<void(LogLevel, std::string_view)>;

const char* level_name(LogLevel lv) noexcept;

// Default sink: "[report] <level>: <message>" on stderr.
void log_to_stderr(LogLevel lv, std::string_view msg);

}
