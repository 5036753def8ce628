#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <chq/models/builder/ast.hpp>
#include <chq/models/builder/value.hpp>

namespace chq {

struct QueryIR;

struct SubqueryIR {
    std::shared_ptr<const QueryIR> query;
};

struct ColumnOperand {
    std::string name;
};

using PredicateOperand = std::variant<Value, Array, ColumnOperand, SubqueryIR>;

struct NormalizedPredicate;
struct NormalizedAndPredicate;
struct NormalizedOrPredicate;
struct NormalizedNotPredicate;
struct RawPredicateIR;

using NormalizedPredicateNode = std::variant<NormalizedPredicate, NormalizedAndPredicate,
                                             NormalizedOrPredicate, NormalizedNotPredicate, RawPredicateIR>;

struct NormalizedPredicate {
    // "table.column", or empty for EXISTS / NOT EXISTS.
    std::string left;
    std::string op;
    PredicateOperand right;
    bool is_prewhere = false;
};

struct NormalizedAndPredicate {
    std::vector<NormalizedPredicateNode> children;
    bool from_combinator = false;
    bool is_prewhere = false;
};

struct NormalizedOrPredicate {
    std::vector<NormalizedPredicateNode> children;
    bool is_prewhere = false;
};

struct NormalizedNotPredicate {
    std::shared_ptr<const NormalizedPredicateNode> child;
    bool is_prewhere = false;
};

struct RawPredicateIR {
    std::string sql;
    bool is_prewhere = false;
};

bool IsPrewhere(const NormalizedPredicateNode& node);

void MarkPrewhere(NormalizedPredicateNode& node);

struct ExprIR;

struct ColumnIR {
    std::string name;
};

struct ValueIR {
    Value value;
};

struct ArrayIR {
    Array values;
};

struct TupleIR {
    Array values;
};

struct RawIR {
    std::string sql;
};

struct FunctionIR {
    std::string name;
    std::vector<ExprIR> args;
};

struct CaseBranchIR {
    std::shared_ptr<const NormalizedPredicateNode> condition;
    std::shared_ptr<const ExprIR> then;
};

struct CaseIR {
    std::vector<CaseBranchIR> branches;
    std::shared_ptr<const ExprIR> otherwise;
};

struct ExprIR {
    std::variant<ColumnIR, ValueIR, ArrayIR, TupleIR, SubqueryIR, RawIR, FunctionIR, CaseIR> node;
    std::optional<std::string> alias;
};

enum class QueryType {
    kSelect,
    kInsert,
    kUpdate,
    kDelete,
};

std::string ToString(QueryType type);

using TableSourceIR = std::variant<std::string, SubqueryIR>;

struct JoinIR {
    JoinType type;
    TableSourceIR table;
    std::optional<std::string> alias;
    NormalizedPredicateNode on;
};

struct WithIR {
    std::string alias;
    SubqueryIR query;
};

struct OrderIR {
    std::string column;
    Direction direction;
};

struct SetOperationIR {
    SetOperation type;
    SubqueryIR query;
};

// Self-contained: holds no references into the AST it was built from.
struct QueryIR {
    QueryType type = QueryType::kSelect;
    std::optional<TableSourceIR> table;
    std::optional<std::string> table_alias;
    std::vector<ExprIR> columns;
    // PREWHERE nodes first, then WHERE nodes.
    std::vector<NormalizedPredicateNode> predicates;
    std::vector<JoinIR> joins;
    std::vector<WithIR> with;
    std::vector<std::string> group_by;
    std::vector<NormalizedPredicateNode> having;
    std::vector<OrderIR> order_by;
    std::optional<std::int64_t> limit;
    std::optional<std::int64_t> offset;
    bool final = false;
    Settings settings;
    std::vector<SetOperationIR> set_operations;
    std::vector<std::string> insert_columns;
    std::vector<Row> values;
    Map set;
};

struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void AddError(std::string message);
    void AddWarning(std::string message);
    // Copies errors of `other` prefixed with `prefix`, warnings as they are.
    void Merge(const ValidationResult& other, std::string_view prefix = {});
};

struct CompiledQuery {
    std::string sql;
    // Values are inlined into `sql`, kept for interface stability.
    std::vector<Value> params;
};

}  // namespace chq
