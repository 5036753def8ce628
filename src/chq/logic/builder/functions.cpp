#include <chq/logic/builder/functions.hpp>

namespace chq {

ExprArg::ExprArg(const char* column) : expr(Col(column)) {}

ExprArg::ExprArg(std::string_view column) : expr(Col(column)) {}

ExprArg::ExprArg(const std::string& column) : expr(Col(column)) {}

Expr As(ExprArg expr, std::string alias) { return WithAlias(std::move(expr.expr), std::move(alias)); }

namespace fn {

namespace {

FunctionCall Unary(std::string name, ExprArg arg) {
  return FunctionCall{.name = std::move(name), .args = {std::move(arg.expr)}};
}

}  // namespace

FunctionCall Call(std::string name, std::vector<ExprArg> args) {
  FunctionCall call{.name = std::move(name)};
  call.args.reserve(args.size());
  for (auto& arg : args) {
    call.args.push_back(std::move(arg.expr));
  }
  return call;
}

FunctionCall Count(std::optional<ExprArg> column) {
  if (!column) {
    return FunctionCall{.name = "count", .args = {Col("*")}};
  }
  return Unary("count", std::move(*column));
}

FunctionCall Sum(ExprArg column) { return Unary("sum", std::move(column)); }

FunctionCall Avg(ExprArg column) { return Unary("avg", std::move(column)); }

FunctionCall Min(ExprArg column) { return Unary("min", std::move(column)); }

FunctionCall Max(ExprArg column) { return Unary("max", std::move(column)); }

FunctionCall Concat(std::vector<ExprArg> columns) { return Call("concat", std::move(columns)); }

FunctionCall Upper(ExprArg column) { return Unary("upper", std::move(column)); }

FunctionCall Lower(ExprArg column) { return Unary("lower", std::move(column)); }

FunctionCall Trim(ExprArg column) { return Unary("trim", std::move(column)); }

FunctionCall Substring(ExprArg column, std::int64_t start, std::optional<std::int64_t> length) {
  std::vector<ExprArg> args{std::move(column), start};
  if (length) {
    args.emplace_back(*length);
  }
  return Call("substring", std::move(args));
}

FunctionCall Round(ExprArg column, std::int64_t decimals) {
  return Call("round", {std::move(column), decimals});
}

FunctionCall Floor(ExprArg column) { return Unary("floor", std::move(column)); }

FunctionCall Ceil(ExprArg column) { return Unary("ceil", std::move(column)); }

FunctionCall Abs(ExprArg column) { return Unary("abs", std::move(column)); }

FunctionCall If(std::string condition, ExprArg then, ExprArg otherwise) {
  return Call("if", {RawExpr{.sql = std::move(condition)}, std::move(then), std::move(otherwise)});
}

FunctionCall Coalesce(std::vector<ExprArg> values) { return Call("coalesce", std::move(values)); }

FunctionCall Now() { return FunctionCall{.name = "now"}; }

FunctionCall Today() { return FunctionCall{.name = "today"}; }

FunctionCall ToDate(ExprArg column) { return Unary("toDate", std::move(column)); }

FunctionCall ToDateTime(ExprArg column) { return Unary("toDateTime", std::move(column)); }

FunctionCall FormatDateTime(ExprArg column, std::string format) {
  return Call("formatDateTime", {std::move(column), Value{std::move(format)}});
}

FunctionCall ArrayElement(ExprArg array, std::int64_t index) {
  return Call("arrayElement", {std::move(array), index});
}

FunctionCall ArrayLength(ExprArg array) { return Unary("length", std::move(array)); }

FunctionCall ArrayJoin(ExprArg array, std::string separator) {
  return Call("arrayStringConcat", {std::move(array), Value{std::move(separator)}});
}

FunctionCall Cast(ExprArg value, std::string type) {
  return Call("cast", {std::move(value), RawExpr{.sql = std::move(type)}});
}

FunctionCall ToString(ExprArg column) { return Unary("toString", std::move(column)); }

FunctionCall ToInt(ExprArg column) { return Unary("toInt32", std::move(column)); }

FunctionCall ToFloat(ExprArg column) { return Unary("toFloat64", std::move(column)); }

FunctionCall Distinct(ExprArg column) { return Unary("distinct", std::move(column)); }

FunctionCall CountDistinct(ExprArg column) {
  return Unary("count", Distinct(std::move(column)));
}

FunctionCall GroupArray(ExprArg column) { return Unary("groupArray", std::move(column)); }

FunctionCall GroupUniqArray(ExprArg column) { return Unary("groupUniqArray", std::move(column)); }

FunctionCall UniqExact(ExprArg column) { return Unary("uniqExact", std::move(column)); }

FunctionCall Quantile(double level, ExprArg column) {
  return Call("quantile", {level, std::move(column)});
}

FunctionCall Median(ExprArg column) { return Unary("median", std::move(column)); }

}  // namespace fn

}  // namespace chq
