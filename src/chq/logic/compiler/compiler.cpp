#include <chq/logic/compiler/compiler.hpp>

#include <string>
#include <utility>

namespace chq {

namespace {

constexpr char kValidationFailed[] = "Query validation failed";

std::string JoinErrors(const std::vector<std::string>& errors) {
  std::string res;
  for (std::size_t i = 0; i < errors.size(); ++i) {
    if (i != 0) {
      res += ", ";
    }
    res += errors[i];
  }
  return res;
}

}  // namespace

QueryCompiler::QueryCompiler(std::shared_ptr<Logger> logger)
    : log_(std::move(logger), "QueryCompiler"),
      validator_(log_.Sink()),
      normalizer_(log_.Sink()),
      renderer_(log_.Sink()) {}

Result<CompiledQuery> QueryCompiler::Compile(const QueryNode& query) const {
  auto validation = validator_.ValidateQuery(query);
  auto normalized = normalizer_.Normalize(query);
  validation.Merge(normalized.validation);

  if (!validation.valid) {
    auto message = std::string{kValidationFailed} + ": " + JoinErrors(validation.errors);
    log_.Error(message);
    return MakeError<ErrorType::kValidation>(std::move(message), {.field = "query"});
  }

  auto compiled = renderer_.Render(normalized.query);
  if (!compiled) {
    return WrapError<ErrorType::kValidation>(std::move(compiled), kValidationFailed);
  }
  log_.Debug("compiled: " + compiled->sql);
  return compiled;
}

ValidationResult QueryCompiler::Validate(const QueryNode& query) const {
  auto validation = validator_.ValidateQuery(query);
  validation.Merge(normalizer_.Normalize(query).validation);
  return validation;
}

}  // namespace chq
