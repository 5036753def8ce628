#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <chq/logic/builder/predicate_builder.hpp>
#include <chq/logic/compiler/compiler.hpp>
#include <chq/logic/log/logger.hpp>
#include <chq/logic/result/error.hpp>
#include <chq/logic/result/result.hpp>
#include <chq/models/builder/ast.hpp>
#include <chq/models/builder/operators.hpp>
#include <chq/models/compiler/ir.hpp>

namespace chq {

// Shared part of the fluent builders: owns one AST node and compiles it.
template <typename Derived, typename Node>
class QueryBuilder {
public:
  ValidationResult Validate() const { return compiler_.Validate(QueryNode{node_}); }

  Result<CompiledQuery> ToSql() const { return compiler_.Compile(QueryNode{node_}); }

  const Node& GetNode() const { return node_; }

protected:
  QueryBuilder(Node node, std::shared_ptr<Logger> logger, std::string component)
      : log_(std::move(logger), std::move(component)), compiler_(log_.Sink()), node_(std::move(node)) {}

  // Lowering errors are kept on the node and reported by Validate() / ToSql().
  std::optional<PredicateNode> Lower(const Condition& condition, std::string_view clause) {
    try {
      return ConditionToPredicate(condition);
    } catch (const Error& error) {
      log_.Debug(std::string{clause} + " lowering failed: " + error.What());
      node_.lowering_errors.push_back(std::string{clause} + ": " + error.What());
      return std::nullopt;
    }
  }

  void AddWhere(const Condition& condition) {
    log_.Debug("adding WHERE clause");
    auto predicate = Lower(condition, "WHERE");
    if (!predicate) {
      return;
    }
    node_.where = MergeAnd(std::move(node_.where), std::move(*predicate));
  }

  ComponentLogger log_;
  QueryCompiler compiler_;
  Node node_;
};

}  // namespace chq
