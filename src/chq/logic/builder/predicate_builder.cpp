#include <chq/logic/builder/predicate_builder.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <chq/logic/result/error.hpp>

namespace chq {

namespace {

Error LoweringError(std::string message, std::string field, std::string value) {
  return Error{ErrorType::kValidation, std::move(message),
               {.field = std::move(field), .value = std::move(value)}};
}

[[noreturn]] void ThrowOperandMismatch(OperatorType type, std::string_view expected) {
  throw LoweringError("Operator " + ToString(type) + " expects " + std::string{expected}, "operator",
                      ToString(type));
}

Expr ScalarOperand(const Operator& op) {
  struct Visitor {
    Expr operator()(const Value& v) { return ValueExpr{.value = v}; }
    Expr operator()(const Subquery& s) { return s; }
    Expr operator()(std::monostate) { ThrowOperandMismatch(type, "a single value"); }
    Expr operator()(const Array&) { ThrowOperandMismatch(type, "a single value"); }
    Expr operator()(const ColumnName&) { ThrowOperandMismatch(type, "a single value"); }

    OperatorType type;
  };
  return std::visit(Visitor{op.type}, op.operand);
}

Expr ListOperand(const Operator& op) {
  struct Visitor {
    Expr operator()(const Array& v) { return ArrayExpr{.values = v}; }
    Expr operator()(const Subquery& s) { return s; }
    Expr operator()(std::monostate) { ThrowOperandMismatch(type, "a list of values"); }
    Expr operator()(const Value&) { ThrowOperandMismatch(type, "a list of values"); }
    Expr operator()(const ColumnName&) { ThrowOperandMismatch(type, "a list of values"); }

    OperatorType type;
  };
  return std::visit(Visitor{op.type}, op.operand);
}

Expr ArrayOperand(const Operator& op) {
  const auto* values = std::get_if<Array>(&op.operand);
  if (!values) {
    throw LoweringError("Operator " + ToString(op.type) + " expects a list of values", "operator",
                        ToString(op.type));
  }
  return ArrayExpr{.values = *values};
}

Subquery SubqueryOperand(const Operator& op, std::string_view keyword) {
  const auto* subquery = std::get_if<Subquery>(&op.operand);
  if (!subquery) {
    throw LoweringError(std::string{keyword} + " operator requires a subquery", "operator",
                        ToString(op.type));
  }
  return *subquery;
}

PredicateNode MakePredicate(ColumnRef left, std::string op, Expr right) {
  return Predicate{.left = std::move(left), .op = std::move(op), .right = std::move(right)};
}

PredicateNode Combine(CombinatorType type, std::vector<PredicateNode> children) {
  switch (type) {
    case CombinatorType::kAnd:
      return AndPredicate{.children = std::move(children), .from_combinator = true};
    case CombinatorType::kOr:
      return OrPredicate{.children = std::move(children)};
    case CombinatorType::kNot:
      if (children.size() != 1) {
        throw LoweringError("Not() takes exactly one condition", "combinator", "not");
      }
      return NotPredicate{.child = std::make_shared<const PredicateNode>(std::move(children.front()))};
  }
  std::unreachable();
}

void RequireConditions(const Combinator& combinator) {
  if (combinator.conditions.empty()) {
    throw LoweringError("Combinator requires at least one condition", "combinator",
                        combinator.type == CombinatorType::kAnd  ? "and"
                        : combinator.type == CombinatorType::kOr ? "or"
                                                                 : "not");
  }
}

}  // namespace

PredicateNode OperatorToPredicate(std::string_view column, const Operator& op) {
  switch (op.type) {
    case OperatorType::kEq:
      return MakePredicate(Col(column), "=", ScalarOperand(op));
    case OperatorType::kNe:
      return MakePredicate(Col(column), "!=", ScalarOperand(op));
    case OperatorType::kGt:
      return MakePredicate(Col(column), ">", ScalarOperand(op));
    case OperatorType::kGte:
      return MakePredicate(Col(column), ">=", ScalarOperand(op));
    case OperatorType::kLt:
      return MakePredicate(Col(column), "<", ScalarOperand(op));
    case OperatorType::kLte:
      return MakePredicate(Col(column), "<=", ScalarOperand(op));
    case OperatorType::kEqCol: {
      const auto* other = std::get_if<ColumnName>(&op.operand);
      if (!other) {
        throw LoweringError("EqCol expects a column name", "operator", ToString(op.type));
      }
      return MakePredicate(Col(column), "=", Col(other->name));
    }
    case OperatorType::kIn:
      return MakePredicate(Col(column), "IN", ListOperand(op));
    case OperatorType::kNotIn:
      return MakePredicate(Col(column), "NOT IN", ListOperand(op));
    case OperatorType::kBetween: {
      const auto* bounds = std::get_if<Array>(&op.operand);
      if (!bounds || bounds->size() != 2) {
        throw LoweringError("BETWEEN requires exactly two values", "operator", ToString(op.type));
      }
      return MakePredicate(Col(column), "BETWEEN", TupleExpr{.values = *bounds});
    }
    case OperatorType::kLike:
      return MakePredicate(Col(column), "LIKE", ScalarOperand(op));
    case OperatorType::kILike:
      return MakePredicate(Col(column), "ILIKE", ScalarOperand(op));
    case OperatorType::kIsNull:
      return MakePredicate(Col(column), "IS NULL", ValueExpr{});
    case OperatorType::kIsNotNull:
      return MakePredicate(Col(column), "IS NOT NULL", ValueExpr{});
    case OperatorType::kHasAny:
      return MakePredicate(Col(column), "HAS ANY", ArrayOperand(op));
    case OperatorType::kHasAll:
      return MakePredicate(Col(column), "HAS ALL", ArrayOperand(op));
    case OperatorType::kInTuple:
      return MakePredicate(Col(column), "IN TUPLE", ArrayOperand(op));
    case OperatorType::kExists:
      return MakePredicate(NoColumn(), "EXISTS", SubqueryOperand(op, "EXISTS"));
    case OperatorType::kNotExists:
      return MakePredicate(NoColumn(), "NOT EXISTS", SubqueryOperand(op, "NOT EXISTS"));
  }
  throw LoweringError("Unsupported operator type", "operator", ToString(op.type));
}

PredicateNode BuildPredicate(const WhereRecord& record) {
  if (record.empty()) {
    throw LoweringError("Empty condition record", "where", "{}");
  }
  std::vector<PredicateNode> children;
  children.reserve(record.size());
  for (const auto& [column, condition] : record) {
    if (const auto* op = std::get_if<Operator>(&condition)) {
      children.push_back(OperatorToPredicate(column, *op));
    } else {
      children.push_back(ApplyColumnToCombinator(column, std::get<Combinator>(condition)));
    }
  }
  if (children.size() == 1) {
    return std::move(children.front());
  }
  return AndPredicate{.children = std::move(children), .from_combinator = false};
}

PredicateNode ApplyColumnToCombinator(std::string_view column, const Combinator& combinator) {
  struct Visitor {
    PredicateNode operator()(const Operator& op) { return OperatorToPredicate(column, op); }
    PredicateNode operator()(const Combinator& nested) {
      return ApplyColumnToCombinator(column, nested);
    }
    PredicateNode operator()(const WhereRecord& record) { return BuildPredicate(record); }
    PredicateNode operator()(const RawExpr& raw) { return RawPredicate{.sql = raw.sql}; }

    std::string_view column;
  };

  RequireConditions(combinator);
  std::vector<PredicateNode> children;
  children.reserve(combinator.conditions.size());
  for (const auto& condition : combinator.conditions) {
    children.push_back(std::visit(Visitor{column}, condition.data));
  }
  return Combine(combinator.type, std::move(children));
}

PredicateNode CombinatorToPredicate(const Combinator& combinator) {
  RequireConditions(combinator);
  std::vector<PredicateNode> children;
  children.reserve(combinator.conditions.size());
  for (const auto& condition : combinator.conditions) {
    children.push_back(ConditionToPredicate(condition));
  }
  return Combine(combinator.type, std::move(children));
}

PredicateNode ConditionToPredicate(const Condition& condition) {
  struct Visitor {
    PredicateNode operator()(const Operator& op) {
      throw LoweringError(
          "Cannot use a bare Operator without a column, pair it with a column name",
          "operator", ToString(op.type));
    }
    PredicateNode operator()(const Combinator& combinator) {
      return CombinatorToPredicate(combinator);
    }
    PredicateNode operator()(const WhereRecord& record) { return BuildPredicate(record); }
    PredicateNode operator()(const RawExpr& raw) { return RawPredicate{.sql = raw.sql}; }
  };
  return std::visit(Visitor{}, condition.data);
}

PredicateNode MergeAnd(std::optional<PredicateNode> current, PredicateNode next) {
  if (!current) {
    return next;
  }
  AndPredicate merged;
  auto append = [&merged](PredicateNode node) {
    auto* group = std::get_if<AndPredicate>(&node);
    if (group && !group->from_combinator) {
      for (auto& child : group->children) {
        merged.children.push_back(std::move(child));
      }
      return;
    }
    merged.children.push_back(std::move(node));
  };
  append(std::move(*current));
  append(std::move(next));
  return merged;
}

}  // namespace chq
