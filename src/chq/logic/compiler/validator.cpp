#include <chq/logic/compiler/validator.hpp>

#include <string>
#include <utility>

#include <chq/logic/compiler/renderer.hpp>

namespace chq {

namespace {

std::string Join(const std::vector<std::string>& items) {
  std::string res;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i != 0) {
      res += ", ";
    }
    res += items[i];
  }
  return res;
}

// Child errors folded into a single line of the parent result.
void Nest(ValidationResult& result, const ValidationResult& child, const std::string& prefix) {
  for (const auto& warning : child.warnings) {
    result.AddWarning(warning);
  }
  if (!child.valid) {
    result.AddError(prefix + Join(child.errors));
  }
}

bool IsExistsOperator(std::string_view op) { return op == "EXISTS" || op == "NOT EXISTS"; }

constexpr char kRawWarning[] = "Raw SQL expression used - ensure it is safe from SQL injection";

}  // namespace

Validator::Validator(std::shared_ptr<Logger> logger) : log_(std::move(logger), "QueryValidator") {}

ValidationResult Validator::ValidateQuery(const QueryNode& query) const {
  struct Visitor {
    ValidationResult operator()(const SelectNode& node) { return validator.ValidateSelect(node); }
    ValidationResult operator()(const InsertNode& node) { return validator.ValidateInsert(node); }
    ValidationResult operator()(const UpdateNode& node) { return validator.ValidateUpdate(node); }
    ValidationResult operator()(const DeleteNode& node) { return validator.ValidateDelete(node); }

    const Validator& validator;
  };
  auto result = std::visit(Visitor{*this}, query);
  if (!result.valid) {
    log_.Debug("query validation failed: " + Join(result.errors));
  }
  return result;
}

ValidationResult Validator::ValidatePredicate(const PredicateNode& predicate) const {
  struct Visitor {
    void operator()(const Predicate& p) {
      const auto* left = std::get_if<ColumnRef>(&p.left);
      if (left && left->name.empty() && IsExistsOperator(p.op)) {
        // EXISTS / NOT EXISTS have no left operand.
      } else if (left) {
        result.Merge(validator.ValidateColumn(*left));
      } else {
        result.Merge(validator.ValidateExpression(p.left));
      }
      result.Merge(validator.ValidateExpression(p.right));
    }
    void operator()(const AndPredicate& p) {
      for (const auto& child : p.children) {
        result.Merge(validator.ValidatePredicate(child));
      }
    }
    void operator()(const OrPredicate& p) {
      for (const auto& child : p.children) {
        result.Merge(validator.ValidatePredicate(child));
      }
    }
    void operator()(const NotPredicate& p) {
      if (!p.child) {
        result.AddError("NOT predicate has no operand");
        return;
      }
      result.Merge(validator.ValidatePredicate(*p.child));
    }
    void operator()(const RawPredicate& p) {
      validator.log_.Warn("raw SQL predicate: " + p.sql);
      result.AddWarning(kRawWarning);
    }

    const Validator& validator;
    ValidationResult& result;
  };

  ValidationResult result;
  std::visit(Visitor{*this, result}, predicate);
  return result;
}

ValidationResult Validator::ValidateExpression(const Expr& expr) const {
  struct Visitor {
    void operator()(const ColumnRef& e) { result.Merge(validator.ValidateColumn(e)); }
    void operator()(const ValueExpr&) {}
    void operator()(const ArrayExpr&) {}
    void operator()(const TupleExpr&) {}
    void operator()(const Subquery& e) { result.Merge(validator.ValidateSubquery(e)); }
    void operator()(const RawExpr& e) {
      validator.log_.Warn("raw SQL expression: " + e.sql);
      result.AddWarning(kRawWarning);
    }
    void operator()(const FunctionCall& e) {
      if (!IsSimpleIdentifier(e.name)) {
        result.AddError("Invalid function name '" + e.name + "'");
      }
      for (std::size_t i = 0; i < e.args.size(); ++i) {
        Nest(result, validator.ValidateExpression(e.args[i]),
             "Function argument " + std::to_string(i) + ": ");
      }
    }
    void operator()(const CaseExpr& e) {
      if (e.branches.empty()) {
        result.AddError("CASE expression requires at least one WHEN branch");
      }
      for (std::size_t i = 0; i < e.branches.size(); ++i) {
        const auto& branch = e.branches[i];
        if (!branch.condition || !branch.then) {
          result.AddError("CASE branch " + std::to_string(i) + " is incomplete");
          continue;
        }
        Nest(result, validator.ValidatePredicate(*branch.condition),
             "Case condition " + std::to_string(i) + ": ");
        Nest(result, validator.ValidateExpression(*branch.then), "Case then " + std::to_string(i) + ": ");
      }
      if (e.otherwise) {
        Nest(result, validator.ValidateExpression(*e.otherwise), "Case else: ");
      }
    }

    const Validator& validator;
    ValidationResult& result;
  };

  ValidationResult result;
  std::visit(Visitor{*this, result}, expr);
  if (const auto& alias = AliasOf(expr)) {
    result.Merge(ValidateIdentifier(*alias, "alias"));
  }
  return result;
}

ValidationResult Validator::ValidateIdentifier(std::string_view identifier,
                                               std::string_view kind) const {
  ValidationResult result;
  if (identifier.empty()) {
    result.AddError("Invalid " + std::string{kind} + " identifier: must be a non-empty string");
  }
  return result;
}

ValidationResult Validator::ValidateSelect(const SelectNode& query) const {
  ValidationResult result;
  for (const auto& error : query.lowering_errors) {
    result.AddError(error);
  }
  for (const auto& with : query.with) {
    result.Merge(ValidateIdentifier(with.alias, "CTE alias"));
    result.Merge(ValidateSubquery(with.query));
  }
  for (const auto& column : query.columns) {
    result.Merge(ValidateExpression(column));
  }
  if (query.from) {
    result.Merge(ValidateTableSource(query.from->table));
    if (query.from->alias) {
      result.Merge(ValidateIdentifier(*query.from->alias, "table alias"));
    }
  }
  for (const auto& join : query.joins) {
    result.Merge(ValidateTableSource(join.table));
    if (join.alias) {
      result.Merge(ValidateIdentifier(*join.alias, "table alias"));
    }
    result.Merge(ValidatePredicate(join.on));
  }
  if (query.prewhere) {
    result.Merge(ValidatePredicate(*query.prewhere));
  }
  if (query.where) {
    result.Merge(ValidatePredicate(*query.where));
  }
  for (const auto& column : query.group_by) {
    result.Merge(ValidateColumn(column));
  }
  if (query.having) {
    result.Merge(ValidatePredicate(*query.having));
  }
  for (const auto& order : query.order_by) {
    result.Merge(ValidateColumn(order.column));
  }
  if (query.limit && *query.limit < 0) {
    result.AddError("LIMIT must be non-negative");
  }
  if (query.offset && *query.offset < 0) {
    result.AddError("OFFSET must be non-negative");
  }
  result.Merge(ValidateSettings(query.settings));
  for (const auto& operation : query.set_operations) {
    result.Merge(ValidateSubquery(operation.query));
  }
  return result;
}

ValidationResult Validator::ValidateInsert(const InsertNode& query) const {
  ValidationResult result = ValidateIdentifier(query.table, "table");
  for (const auto& column : query.columns) {
    result.Merge(ValidateIdentifier(column, "column"));
  }
  if (query.columns.empty()) {
    return result;
  }
  for (std::size_t i = 0; i < query.values.size(); ++i) {
    if (query.values[i].size() != query.columns.size()) {
      result.AddError("Row " + std::to_string(i) + " has " + std::to_string(query.values[i].size())
                      + " values, expected " + std::to_string(query.columns.size()));
    }
  }
  return result;
}

ValidationResult Validator::ValidateUpdate(const UpdateNode& query) const {
  ValidationResult result = ValidateIdentifier(query.table, "table");
  for (const auto& error : query.lowering_errors) {
    result.AddError(error);
  }
  if (query.set.empty()) {
    result.AddError("UPDATE requires at least one SET assignment");
  }
  for (const auto& entry : query.set) {
    result.Merge(ValidateIdentifier(entry.key, "column"));
  }
  if (query.where) {
    result.Merge(ValidatePredicate(*query.where));
  }
  result.Merge(ValidateSettings(query.settings));
  return result;
}

ValidationResult Validator::ValidateDelete(const DeleteNode& query) const {
  ValidationResult result = ValidateIdentifier(query.table, "table");
  for (const auto& error : query.lowering_errors) {
    result.AddError(error);
  }
  if (query.where) {
    result.Merge(ValidatePredicate(*query.where));
  }
  result.Merge(ValidateSettings(query.settings));
  return result;
}

ValidationResult Validator::ValidateSubquery(const Subquery& subquery) const {
  ValidationResult result;
  if (!subquery.query) {
    result.AddError("Subquery is empty");
    return result;
  }
  Nest(result, ValidateSelect(*subquery.query), "Subquery validation failed: ");
  return result;
}

ValidationResult Validator::ValidateTableSource(const TableSource& source) const {
  if (const auto* table = std::get_if<std::string>(&source)) {
    return ValidateIdentifier(*table, "table");
  }
  return ValidateSubquery(std::get<Subquery>(source));
}

ValidationResult Validator::ValidateColumn(const ColumnRef& column) const {
  ValidationResult result = ValidateIdentifier(column.name, "column");
  if (column.table) {
    result.Merge(ValidateIdentifier(*column.table, "table"));
  }
  return result;
}

ValidationResult Validator::ValidateSettings(const Settings& settings) const {
  ValidationResult result;
  for (const auto& entry : settings) {
    if (!IsSimpleIdentifier(entry.key)) {
      result.AddError("Invalid setting name '" + entry.key + "'");
    }
  }
  return result;
}

}  // namespace chq
