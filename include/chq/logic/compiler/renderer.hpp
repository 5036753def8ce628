#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <chq/logic/log/logger.hpp>
#include <chq/logic/result/result.hpp>
#include <chq/models/compiler/ir.hpp>

namespace chq {

enum class QuoteContext {
  kSelect,
  kPredicate,
};

// [A-Za-z_][A-Za-z0-9_]*
bool IsSimpleIdentifier(std::string_view identifier);

// Backtick-quotes `identifier`. "*" and numeric literals stay bare, so does
// function-call text in select context. "t.c" is quoted part by part. Embedded
// backticks and backslashes are escaped with a backslash. Throws Error
// (kValidation) for malformed qualified names.
std::string QuoteIdentifier(std::string_view identifier,
                            QuoteContext context = QuoteContext::kSelect);

// Renders normalized queries as ClickHouse SQL with values inlined.
class ClickHouseRenderer {
public:
  explicit ClickHouseRenderer(std::shared_ptr<Logger> logger = nullptr);

  Result<CompiledQuery> Render(const QueryIR& query) const;

private:
  std::string RenderQuery(const QueryIR& query) const;
  std::string RenderSelect(const QueryIR& query) const;
  std::string RenderInsert(const QueryIR& query) const;
  std::string RenderUpdate(const QueryIR& query) const;
  std::string RenderDelete(const QueryIR& query) const;

  std::string RenderPredicates(const std::vector<NormalizedPredicateNode>& predicates,
                               bool top_level) const;
  std::string RenderPredicateNode(const NormalizedPredicateNode& predicate, bool top_level) const;
  std::string RenderPredicate(const NormalizedPredicate& predicate) const;
  std::string RenderOperand(const PredicateOperand& operand) const;
  std::string RenderExpr(const ExprIR& expr) const;
  std::string RenderSubquery(const SubqueryIR& subquery) const;
  std::string RenderTableSource(const TableSourceIR& source) const;
  std::string RenderSettings(const Settings& settings) const;

  ComponentLogger log_;
};

}  // namespace chq
