#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <chq/models/builder/value.hpp>

namespace chq {

class SelectBuilder;

struct SelectNode;

struct ColumnRef;
struct ValueExpr;
struct ArrayExpr;
struct TupleExpr;
struct Subquery;
struct RawExpr;
struct FunctionCall;
struct CaseExpr;

using Expr
    = std::variant<ColumnRef, ValueExpr, ArrayExpr, TupleExpr, Subquery, RawExpr, FunctionCall, CaseExpr>;

struct Predicate;
struct AndPredicate;
struct OrPredicate;
struct NotPredicate;
struct RawPredicate;

using PredicateNode = std::variant<Predicate, AndPredicate, OrPredicate, NotPredicate, RawPredicate>;

struct ColumnRef {
    std::string name;
    std::optional<std::string> table;
    std::optional<std::string> alias;
};

// "t.c" becomes {name: "c", table: "t"}, split on the first dot.
ColumnRef Col(std::string_view column);

// Empty-named column, the left side of EXISTS / NOT EXISTS.
ColumnRef NoColumn();

struct ValueExpr {
    Value value;
    std::optional<std::string> alias;
};

struct ArrayExpr {
    Array values;
    std::optional<std::string> alias;
};

struct TupleExpr {
    Array values;
    std::optional<std::string> alias;
};

// Immutable snapshot of a SELECT taken when the subquery is created; later
// changes to the originating builder are not observed.
struct Subquery {
    explicit Subquery(std::shared_ptr<const SelectNode> node);
    explicit Subquery(const SelectBuilder& builder);

    std::shared_ptr<const SelectNode> query;
    std::optional<std::string> alias;
};

// Passed to SQL verbatim. Never escaped.
struct RawExpr {
    std::string sql;
    std::optional<std::string> alias;
};

struct FunctionCall {
    std::string name;
    std::vector<Expr> args;
    std::optional<std::string> alias;
};

struct CaseBranch {
    std::shared_ptr<const PredicateNode> condition;
    std::shared_ptr<const Expr> then;
};

struct CaseExpr {
    std::vector<CaseBranch> branches;
    std::shared_ptr<const Expr> otherwise;
    std::optional<std::string> alias;
};

const std::optional<std::string>& AliasOf(const Expr& expr);

Expr WithAlias(Expr expr, std::string alias);

// Depth of CASE expressions nested through THEN / ELSE branches, 0 for
// anything that is not a CASE.
std::size_t CaseDepth(const Expr& expr);

struct Predicate {
    Expr left;
    std::string op;
    Expr right;
};

struct AndPredicate {
    std::vector<PredicateNode> children;
    // Built by an explicit And(), as opposed to merged WHERE conditions.
    bool from_combinator = false;
};

struct OrPredicate {
    std::vector<PredicateNode> children;
};

struct NotPredicate {
    std::shared_ptr<const PredicateNode> child;
};

struct RawPredicate {
    std::string sql;
};

enum class JoinType {
    kInner,
    kLeft,
    kRight,
    kFull,
};

std::string ToString(JoinType type);

enum class Direction {
    kAsc,
    kDesc,
};

std::string ToString(Direction direction);

enum class SetOperation {
    kUnion,
    kUnionAll,
};

std::string ToString(SetOperation operation);

using TableSource = std::variant<std::string, Subquery>;

struct FromClause {
    TableSource table;
    std::optional<std::string> alias;
};

struct JoinSpec {
    JoinType type;
    TableSource table;
    std::optional<std::string> alias;
    PredicateNode on;
};

struct WithClause {
    std::string alias;
    Subquery query;
};

struct OrderSpec {
    ColumnRef column;
    Direction direction;
};

struct SetOperationSpec {
    SetOperation type;
    Subquery query;
};

struct SelectNode {
    std::vector<Expr> columns;
    std::optional<FromClause> from;
    std::vector<JoinSpec> joins;
    std::vector<WithClause> with;
    std::optional<PredicateNode> prewhere;
    std::optional<PredicateNode> where;
    std::vector<ColumnRef> group_by;
    std::optional<PredicateNode> having;
    std::vector<OrderSpec> order_by;
    std::optional<std::int64_t> limit;
    std::optional<std::int64_t> offset;
    bool final = false;
    Settings settings;
    std::optional<std::string> format;
    std::vector<SetOperationSpec> set_operations;
    std::vector<std::string> lowering_errors;
};

struct InsertNode {
    std::string table;
    std::vector<std::string> columns;
    std::vector<Row> values;
    std::optional<std::string> format;
};

struct UpdateNode {
    std::string table;
    Map set;
    std::optional<PredicateNode> where;
    Settings settings;
    std::vector<std::string> lowering_errors;
};

struct DeleteNode {
    std::string table;
    std::optional<PredicateNode> where;
    Settings settings;
    std::vector<std::string> lowering_errors;
};

using QueryNode = std::variant<SelectNode, InsertNode, UpdateNode, DeleteNode>;

}  // namespace chq
