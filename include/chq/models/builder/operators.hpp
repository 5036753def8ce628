#pragma once

#include <concepts>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <chq/models/builder/ast.hpp>
#include <chq/models/builder/value.hpp>

namespace chq {

enum class OperatorType {
    kEq,
    kNe,
    kGt,
    kGte,
    kLt,
    kLte,
    kEqCol,
    kIn,
    kNotIn,
    kBetween,
    kLike,
    kILike,
    kIsNull,
    kIsNotNull,
    kHasAny,
    kHasAll,
    kInTuple,
    kExists,
    kNotExists,
};

std::string ToString(OperatorType type);

struct ColumnName {
    std::string name;
};

// Right-hand side of a comparison: a literal or a subquery.
struct Operand {
    template <typename T>
        requires std::constructible_from<Value, T&&>
    Operand(T&& value) : data(Value(std::forward<T>(value))) {}
    Operand(Subquery subquery);

    std::variant<Value, Subquery> data;
};

struct Operator {
    OperatorType type;
    std::variant<std::monostate, Value, Array, ColumnName, Subquery> operand;
};

Operator Eq(Operand value);
Operator Ne(Operand value);
Operator Gt(Operand value);
Operator Gte(Operand value);
Operator Lt(Operand value);
Operator Lte(Operand value);
Operator EqCol(std::string column);
Operator In(Array values);
Operator In(Subquery subquery);
Operator NotIn(Array values);
Operator NotIn(Subquery subquery);
Operator Between(Value start, Value end);
Operator Like(std::string pattern);
Operator ILike(std::string pattern);
Operator IsNull();
Operator IsNotNull();
Operator HasAny(Array values);
Operator HasAll(Array values);
Operator InTuple(std::vector<Array> rows);
// Only a subquery operand is accepted; anything else is rejected when the
// operator is lowered.
Operator Exists(Operand subquery);
Operator NotExists(Operand subquery);

// LIKE helpers, '%', '_' and '\' in the fragment match literally.
Operator StartsWith(std::string_view prefix);
Operator EndsWith(std::string_view suffix);
Operator Contains(std::string_view fragment);

std::string EscapeLikePattern(std::string_view pattern);

// Opaque SQL. Not escaped, never validated.
RawExpr Raw(std::string sql);

enum class CombinatorType {
    kAnd,
    kOr,
    kNot,
};

struct Condition;

struct Combinator {
    CombinatorType type;
    std::vector<Condition> conditions;
};

using ColumnCondition = std::variant<Operator, Combinator>;
using WhereEntry = std::pair<std::string, ColumnCondition>;
// Column-keyed conditions, several entries are AND-combined.
using WhereRecord = std::vector<WhereEntry>;

struct Condition {
    Condition(Operator op);
    Condition(Combinator combinator);
    Condition(WhereRecord record);
    Condition(RawExpr raw);
    Condition(std::string column, Operator op);
    Condition(std::string column, Combinator combinator);

    std::variant<Operator, Combinator, WhereRecord, RawExpr> data;
};

Combinator And(std::vector<Condition> conditions);
Combinator Or(std::vector<Condition> conditions);
Combinator Not(Condition condition);

template <typename... Ts>
    requires(sizeof...(Ts) > 0 && (std::constructible_from<Condition, Ts &&> && ...))
Combinator And(Ts&&... conditions) {
  return And(std::vector<Condition>{Condition(std::forward<Ts>(conditions))...});
}

template <typename... Ts>
    requires(sizeof...(Ts) > 0 && (std::constructible_from<Condition, Ts &&> && ...))
Combinator Or(Ts&&... conditions) {
  return Or(std::vector<Condition>{Condition(std::forward<Ts>(conditions))...});
}

}  // namespace chq
