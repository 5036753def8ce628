#pragma once

#include <memory>

#include <chq/logic/log/logger.hpp>
#include <chq/models/builder/ast.hpp>
#include <chq/models/compiler/ir.hpp>

namespace chq {

struct NormalizedQuery {
    QueryIR query;
    ValidationResult validation;
};

// Lowers the AST into a self-contained QueryIR. Lowering failures are caught
// and reported through `validation`, `query` is then left default.
class Normalizer {
public:
  explicit Normalizer(std::shared_ptr<Logger> logger = nullptr);

  NormalizedQuery Normalize(const QueryNode& query) const;

  // Throwing counterparts, Error (kValidation) on unsupported input.
  QueryIR NormalizeSelect(const SelectNode& query) const;
  ExprIR NormalizeExpr(const Expr& expr) const;
  NormalizedPredicateNode NormalizePredicate(const PredicateNode& predicate) const;

private:
  QueryIR NormalizeInsert(const InsertNode& query) const;
  QueryIR NormalizeUpdate(const UpdateNode& query) const;
  QueryIR NormalizeDelete(const DeleteNode& query) const;

  PredicateOperand ExtractValue(const Expr& expr) const;
  SubqueryIR NormalizeSubquery(const Subquery& subquery) const;
  TableSourceIR NormalizeTableSource(const TableSource& source) const;

  ComponentLogger log_;
};

// "table.column" for qualified references, the bare name otherwise.
std::string NormalizeColumnRef(const ColumnRef& column);

}  // namespace chq
