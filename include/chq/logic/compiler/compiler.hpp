#pragma once

#include <memory>

#include <chq/logic/compiler/normalizer.hpp>
#include <chq/logic/compiler/renderer.hpp>
#include <chq/logic/compiler/validator.hpp>
#include <chq/logic/log/logger.hpp>
#include <chq/logic/result/result.hpp>
#include <chq/models/builder/ast.hpp>

namespace chq {

// Validate + Normalize -> Render. Validation and normalization problems are
// reported together as one kValidation error.
class QueryCompiler {
public:
  explicit QueryCompiler(std::shared_ptr<Logger> logger = nullptr);

  Result<CompiledQuery> Compile(const QueryNode& query) const;
  ValidationResult Validate(const QueryNode& query) const;

private:
  ComponentLogger log_;
  Validator validator_;
  Normalizer normalizer_;
  ClickHouseRenderer renderer_;
};

}  // namespace chq
