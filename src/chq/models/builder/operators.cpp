#include <chq/models/builder/operators.hpp>

#include <utility>

namespace chq {

namespace {

Operator Compare(OperatorType type, Operand value) {
  return std::visit(
      [type](auto&& operand) { return Operator{type, std::forward<decltype(operand)>(operand)}; },
      std::move(value.data));
}

Operator WithList(OperatorType type, Array values) {
  Operator op{type, {}};
  op.operand.emplace<Array>(std::move(values));
  return op;
}

}  // namespace

std::string ToString(OperatorType type) {
  switch (type) {
    case OperatorType::kEq:
      return "eq";
    case OperatorType::kNe:
      return "ne";
    case OperatorType::kGt:
      return "gt";
    case OperatorType::kGte:
      return "gte";
    case OperatorType::kLt:
      return "lt";
    case OperatorType::kLte:
      return "lte";
    case OperatorType::kEqCol:
      return "eq_col";
    case OperatorType::kIn:
      return "in";
    case OperatorType::kNotIn:
      return "not_in";
    case OperatorType::kBetween:
      return "between";
    case OperatorType::kLike:
      return "like";
    case OperatorType::kILike:
      return "ilike";
    case OperatorType::kIsNull:
      return "is_null";
    case OperatorType::kIsNotNull:
      return "is_not_null";
    case OperatorType::kHasAny:
      return "has_any";
    case OperatorType::kHasAll:
      return "has_all";
    case OperatorType::kInTuple:
      return "in_tuple";
    case OperatorType::kExists:
      return "exists";
    case OperatorType::kNotExists:
      return "not_exists";
  }
  std::unreachable();
}

Operand::Operand(Subquery subquery) : data(std::move(subquery)) {}

Operator Eq(Operand value) { return Compare(OperatorType::kEq, std::move(value)); }

Operator Ne(Operand value) { return Compare(OperatorType::kNe, std::move(value)); }

Operator Gt(Operand value) { return Compare(OperatorType::kGt, std::move(value)); }

Operator Gte(Operand value) { return Compare(OperatorType::kGte, std::move(value)); }

Operator Lt(Operand value) { return Compare(OperatorType::kLt, std::move(value)); }

Operator Lte(Operand value) { return Compare(OperatorType::kLte, std::move(value)); }

Operator EqCol(std::string column) {
  return Operator{OperatorType::kEqCol, ColumnName{std::move(column)}};
}

Operator In(Array values) { return WithList(OperatorType::kIn, std::move(values)); }

Operator In(Subquery subquery) { return Operator{OperatorType::kIn, std::move(subquery)}; }

Operator NotIn(Array values) { return WithList(OperatorType::kNotIn, std::move(values)); }

Operator NotIn(Subquery subquery) { return Operator{OperatorType::kNotIn, std::move(subquery)}; }

Operator Between(Value start, Value end) {
  return WithList(OperatorType::kBetween, Array{std::move(start), std::move(end)});
}

Operator Like(std::string pattern) { return Operator{OperatorType::kLike, Value{std::move(pattern)}}; }

Operator ILike(std::string pattern) {
  return Operator{OperatorType::kILike, Value{std::move(pattern)}};
}

Operator IsNull() { return Operator{OperatorType::kIsNull, std::monostate{}}; }

Operator IsNotNull() { return Operator{OperatorType::kIsNotNull, std::monostate{}}; }

Operator HasAny(Array values) { return WithList(OperatorType::kHasAny, std::move(values)); }

Operator HasAll(Array values) { return WithList(OperatorType::kHasAll, std::move(values)); }

Operator InTuple(std::vector<Array> rows) {
  Array tuples;
  tuples.reserve(rows.size());
  for (auto& row : rows) {
    tuples.emplace_back(std::move(row));
  }
  return WithList(OperatorType::kInTuple, std::move(tuples));
}

Operator Exists(Operand subquery) { return Compare(OperatorType::kExists, std::move(subquery)); }

Operator NotExists(Operand subquery) {
  return Compare(OperatorType::kNotExists, std::move(subquery));
}

std::string EscapeLikePattern(std::string_view pattern) {
  std::string escaped;
  escaped.reserve(pattern.size());
  for (char c : pattern) {
    if (c == '%' || c == '_' || c == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(c);
  }
  return escaped;
}

Operator StartsWith(std::string_view prefix) { return Like(EscapeLikePattern(prefix) + "%"); }

Operator EndsWith(std::string_view suffix) { return Like("%" + EscapeLikePattern(suffix)); }

Operator Contains(std::string_view fragment) {
  return Like("%" + EscapeLikePattern(fragment) + "%");
}

RawExpr Raw(std::string sql) { return RawExpr{.sql = std::move(sql)}; }

Condition::Condition(Operator op) : data(std::move(op)) {}

Condition::Condition(Combinator combinator) : data(std::move(combinator)) {}

Condition::Condition(WhereRecord record) : data(std::move(record)) {}

Condition::Condition(RawExpr raw) : data(std::move(raw)) {}

Condition::Condition(std::string column, Operator op)
    : data(WhereRecord{WhereEntry{std::move(column), std::move(op)}}) {}

Condition::Condition(std::string column, Combinator combinator)
    : data(WhereRecord{WhereEntry{std::move(column), std::move(combinator)}}) {}

Combinator And(std::vector<Condition> conditions) {
  return Combinator{CombinatorType::kAnd, std::move(conditions)};
}

Combinator Or(std::vector<Condition> conditions) {
  return Combinator{CombinatorType::kOr, std::move(conditions)};
}

Combinator Not(Condition condition) {
  return Combinator{CombinatorType::kNot, {std::move(condition)}};
}

}  // namespace chq
