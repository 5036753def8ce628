#pragma once

#include <optional>
#include <string_view>

#include <chq/models/builder/ast.hpp>
#include <chq/models/builder/operators.hpp>

namespace chq {

// Lowering from operators and combinators to PredicateNode trees. Every
// builder goes through these functions. They throw Error (kValidation) on
// malformed input.

PredicateNode OperatorToPredicate(std::string_view column, const Operator& op);

// One entry lowers to a single node, several entries to a non-combinator AND.
PredicateNode BuildPredicate(const WhereRecord& record);

// Distributes `column` onto every bare Operator inside `combinator`. Nested
// records are lowered with their own columns.
PredicateNode ApplyColumnToCombinator(std::string_view column, const Combinator& combinator);

PredicateNode CombinatorToPredicate(const Combinator& combinator);

PredicateNode ConditionToPredicate(const Condition& condition);

// AND-combines `next` into the existing clause without marking it as an
// explicit combinator.
PredicateNode MergeAnd(std::optional<PredicateNode> current, PredicateNode next);

}  // namespace chq
