#include "khiops_report/report_format.hpp"

#include <cctype>
#include <filesystem>
#include <string>

namespace kr {

ReportFormat detect_format(std::string_view path) {
  auto ext = std::filesystem::path(std::string(path)).extension().string();
  for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (ext == ".khj")  return ReportFormat::KhiopsJson;
  if (ext == ".khcj") return ReportFormat::CoclusteringJson;
  if (ext == ".json") return ReportFormat::Json;
  return ReportFormat::Unknown;
}

const char* format_name(ReportFormat f) noexcept {
  switch (f) {
    case ReportFormat::KhiopsJson:       return "khiops-json";
    case ReportFormat::CoclusteringJson: return "coclustering-json";
    case ReportFormat::Json:             return "json";
    case ReportFormat::Unknown:          return "unknown";
  }
  return "unknown";
}

}
