#include "khiops_report/report_model.hpp"
#include "khiops_report/structural_parser.hpp"

namespace kr {

const char* section_kind_name(SectionKind k) noexcept {
  switch (k) {
    case SectionKind::Modeling:    return "modeling";
    case SectionKind::Evaluation:  return "evaluation";
    case SectionKind::Preparation: return "preparation";
    case SectionKind::Other:       return "other";
  }
  return "other";
}

SectionKind classify_section(std::string_view name) noexcept {
  if (StructuralParser::key_contains(name, "evaluation"))  return SectionKind::Evaluation;
  if (StructuralParser::key_contains(name, "preparation")) return SectionKind::Preparation;
  if (StructuralParser::key_contains(name, "modeling") ||
      StructuralParser::key_contains(name, "modelling"))   return SectionKind::Modeling;
  return SectionKind::Other;
}

const ReportItem* ReportSection::find_item(std::string_view rank) const {
  for (const auto& item : items) if (item.rank == rank) return &item;
  return nullptr;
}

}
