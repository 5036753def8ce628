#pragma once

#include <memory>
#include <string_view>

#include <chq/logic/log/logger.hpp>
#include <chq/models/builder/ast.hpp>
#include <chq/models/compiler/ir.hpp>

namespace chq {

// Structural checks over the AST. Never throws: every problem ends up in the
// returned ValidationResult, all of them, not only the first one.
class Validator {
public:
  explicit Validator(std::shared_ptr<Logger> logger = nullptr);

  ValidationResult ValidateQuery(const QueryNode& query) const;
  ValidationResult ValidatePredicate(const PredicateNode& predicate) const;
  ValidationResult ValidateExpression(const Expr& expr) const;
  ValidationResult ValidateIdentifier(std::string_view identifier, std::string_view kind) const;

private:
  ValidationResult ValidateSelect(const SelectNode& query) const;
  ValidationResult ValidateInsert(const InsertNode& query) const;
  ValidationResult ValidateUpdate(const UpdateNode& query) const;
  ValidationResult ValidateDelete(const DeleteNode& query) const;
  ValidationResult ValidateSubquery(const Subquery& subquery) const;
  ValidationResult ValidateTableSource(const TableSource& source) const;
  ValidationResult ValidateColumn(const ColumnRef& column) const;
  ValidationResult ValidateSettings(const Settings& settings) const;

  ComponentLogger log_;
};

}  // namespace chq
