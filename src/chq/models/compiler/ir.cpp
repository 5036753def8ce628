#include <chq/models/compiler/ir.hpp>

#include <utility>

namespace chq {

bool IsPrewhere(const NormalizedPredicateNode& node) {
  return std::visit([](const auto& n) { return n.is_prewhere; }, node);
}

void MarkPrewhere(NormalizedPredicateNode& node) {
  std::visit([](auto& n) { n.is_prewhere = true; }, node);
}

std::string ToString(QueryType type) {
  switch (type) {
    case QueryType::kSelect:
      return "select";
    case QueryType::kInsert:
      return "insert";
    case QueryType::kUpdate:
      return "update";
    case QueryType::kDelete:
      return "delete";
  }
  std::unreachable();
}

void ValidationResult::AddError(std::string message) {
  valid = false;
  errors.push_back(std::move(message));
}

void ValidationResult::AddWarning(std::string message) { warnings.push_back(std::move(message)); }

void ValidationResult::Merge(const ValidationResult& other, std::string_view prefix) {
  for (const auto& error : other.errors) {
    AddError(std::string{prefix} + error);
  }
  for (const auto& warning : other.warnings) {
    AddWarning(warning);
  }
}

}  // namespace chq
