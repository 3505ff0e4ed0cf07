#pragma once
#include <string_view>

namespace kr {

enum class ReportFormat { KhiopsJson, CoclusteringJson, Json, Unknown };

// Guess format from extension (.khj | .khcj | .json).
ReportFormat detect_format(std::string_view path);

const char* format_name(ReportFormat f) noexcept;

}
