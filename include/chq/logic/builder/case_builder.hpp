#pragma once

#include <cstddef>
#include <vector>

#include <chq/logic/builder/functions.hpp>
#include <chq/models/builder/ast.hpp>
#include <chq/models/builder/operators.hpp>

namespace chq {

inline constexpr std::size_t kMaxCaseDepth = 10;

// CASE WHEN ... THEN ... [ELSE ...] END. Throws Error (kValidation) once
// CASE expressions nest deeper than kMaxCaseDepth.
class CaseBuilder {
public:
  CaseBuilder& When(const Condition& condition, ExprArg then);
  CaseBuilder& When(PredicateNode condition, ExprArg then);

  CaseExpr Else(ExprArg otherwise) const;
  CaseExpr End() const;

private:
  std::vector<CaseBranch> branches_;
  std::size_t nested_cases_ = 0;
};

CaseBuilder Case();

}  // namespace chq
