#include "khiops_report/log.hpp"

#include <iostream>

namespace kr {

const char* level_name(LogLevel lv) noexcept {
  switch (lv) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
  }
  return "?";
}

void log_to_stderr(LogLevel lv, std::string_view msg) {
  std::cerr << "[report] " << level_name(lv) << ": " << msg << "\n";
}

}
