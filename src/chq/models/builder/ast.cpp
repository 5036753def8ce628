#include <chq/models/builder/ast.hpp>

#include <algorithm>
#include <utility>

namespace chq {

ColumnRef Col(std::string_view column) {
  auto dot = column.find('.');
  if (dot == std::string_view::npos) {
    return ColumnRef{.name = std::string{column}};
  }
  return ColumnRef{.name = std::string{column.substr(dot + 1)},
                   .table = std::string{column.substr(0, dot)}};
}

ColumnRef NoColumn() { return ColumnRef{}; }

Subquery::Subquery(std::shared_ptr<const SelectNode> node) : query(std::move(node)) {}

const std::optional<std::string>& AliasOf(const Expr& expr) {
  return std::visit([](const auto& e) -> const std::optional<std::string>& { return e.alias; },
                    expr);
}

Expr WithAlias(Expr expr, std::string alias) {
  std::visit([&alias](auto& e) { e.alias = std::move(alias); }, expr);
  return expr;
}

std::size_t CaseDepth(const Expr& expr) {
  const auto* case_expr = std::get_if<CaseExpr>(&expr);
  if (!case_expr) {
    return 0;
  }
  std::size_t nested = 0;
  for (const auto& branch : case_expr->branches) {
    if (branch.then) {
      nested = std::max(nested, CaseDepth(*branch.then));
    }
  }
  if (case_expr->otherwise) {
    nested = std::max(nested, CaseDepth(*case_expr->otherwise));
  }
  return nested + 1;
}

std::string ToString(JoinType type) {
  switch (type) {
    case JoinType::kInner:
      return "INNER";
    case JoinType::kLeft:
      return "LEFT";
    case JoinType::kRight:
      return "RIGHT";
    case JoinType::kFull:
      return "FULL";
  }
  std::unreachable();
}

std::string ToString(Direction direction) {
  switch (direction) {
    case Direction::kAsc:
      return "ASC";
    case Direction::kDesc:
      return "DESC";
  }
  std::unreachable();
}

std::string ToString(SetOperation operation) {
  switch (operation) {
    case SetOperation::kUnion:
      return "UNION";
    case SetOperation::kUnionAll:
      return "UNION ALL";
  }
  std::unreachable();
}

}  // namespace chq
