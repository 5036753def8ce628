#include <chq/logic/builder/case_builder.hpp>

#include <memory>
#include <string>
#include <utility>

#include <chq/logic/builder/predicate_builder.hpp>
#include <chq/logic/result/error.hpp>

namespace chq {

namespace {

Error DepthExceeded() {
  return Error{ErrorType::kValidation,
               "Maximum CASE nesting depth (" + std::to_string(kMaxCaseDepth) + ") exceeded",
               {.field = "case", .value = "nesting"}};
}

}  // namespace

CaseBuilder& CaseBuilder::When(const Condition& condition, ExprArg then) {
  return When(ConditionToPredicate(condition), std::move(then));
}

CaseBuilder& CaseBuilder::When(PredicateNode condition, ExprArg then) {
  if (std::holds_alternative<CaseExpr>(then.expr)) {
    if (++nested_cases_ > kMaxCaseDepth || CaseDepth(then.expr) >= kMaxCaseDepth) {
      throw DepthExceeded();
    }
  }
  branches_.push_back(CaseBranch{
      .condition = std::make_shared<const PredicateNode>(std::move(condition)),
      .then = std::make_shared<const Expr>(std::move(then.expr)),
  });
  return *this;
}

CaseExpr CaseBuilder::Else(ExprArg otherwise) const {
  if (CaseDepth(otherwise.expr) >= kMaxCaseDepth) {
    throw DepthExceeded();
  }
  return CaseExpr{
      .branches = branches_,
      .otherwise = std::make_shared<const Expr>(std::move(otherwise.expr)),
  };
}

CaseExpr CaseBuilder::End() const { return CaseExpr{.branches = branches_}; }

CaseBuilder Case() { return CaseBuilder{}; }

}  // namespace chq
