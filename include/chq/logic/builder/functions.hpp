#pragma once

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <chq/models/builder/ast.hpp>
#include <chq/models/builder/value.hpp>

namespace chq {

// Argument of a function or CASE branch. Strings name columns ("t.c" is
// split), other literals become values.
struct ExprArg {
    template <typename T>
        requires std::constructible_from<Expr, T&&>
    ExprArg(T&& expr) : expr(std::forward<T>(expr)) {}

    template <typename T>
        requires(!std::constructible_from<Expr, T &&> && !std::convertible_to<T &&, std::string_view>
                 && std::constructible_from<Value, T &&>)
    ExprArg(T&& value) : expr(ValueExpr{.value = Value(std::forward<T>(value))}) {}

    ExprArg(const char* column);
    ExprArg(std::string_view column);
    ExprArg(const std::string& column);

    Expr expr;
};

// Wraps an expression of any kind with an alias, for use as a SELECT column.
Expr As(ExprArg expr, std::string alias);

namespace fn {

FunctionCall Call(std::string name, std::vector<ExprArg> args);

// count(*) without an argument.
FunctionCall Count(std::optional<ExprArg> column = std::nullopt);
FunctionCall Sum(ExprArg column);
FunctionCall Avg(ExprArg column);
FunctionCall Min(ExprArg column);
FunctionCall Max(ExprArg column);

FunctionCall Concat(std::vector<ExprArg> columns);
FunctionCall Upper(ExprArg column);
FunctionCall Lower(ExprArg column);
FunctionCall Trim(ExprArg column);
FunctionCall Substring(ExprArg column, std::int64_t start, std::optional<std::int64_t> length = std::nullopt);

FunctionCall Round(ExprArg column, std::int64_t decimals = 0);
FunctionCall Floor(ExprArg column);
FunctionCall Ceil(ExprArg column);
FunctionCall Abs(ExprArg column);

// `condition` is raw SQL.
FunctionCall If(std::string condition, ExprArg then, ExprArg otherwise);
FunctionCall Coalesce(std::vector<ExprArg> values);

FunctionCall Now();
FunctionCall Today();
FunctionCall ToDate(ExprArg column);
FunctionCall ToDateTime(ExprArg column);
FunctionCall FormatDateTime(ExprArg column, std::string format);

FunctionCall ArrayElement(ExprArg array, std::int64_t index);
FunctionCall ArrayLength(ExprArg array);
FunctionCall ArrayJoin(ExprArg array, std::string separator = ",");

// Rendered as CAST(x AS type).
FunctionCall Cast(ExprArg value, std::string type);
FunctionCall ToString(ExprArg column);
FunctionCall ToInt(ExprArg column);
FunctionCall ToFloat(ExprArg column);

FunctionCall Distinct(ExprArg column);
FunctionCall CountDistinct(ExprArg column);
FunctionCall GroupArray(ExprArg column);
FunctionCall GroupUniqArray(ExprArg column);
FunctionCall UniqExact(ExprArg column);
// Rendered as quantile(level)(x).
FunctionCall Quantile(double level, ExprArg column);
FunctionCall Median(ExprArg column);

}  // namespace fn

}  // namespace chq
