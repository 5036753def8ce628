#include <gmock/gmock.h>

#include <memory>
#include <string>

#include <chq/logic/builder/functions.hpp>
#include <chq/logic/builder/select_builder.hpp>

using ::testing::HasSubstr;
using ::testing::IsFalse;

namespace chq {

namespace {

std::string Render(ExprArg expr) {
  auto sql = Select({std::move(expr.expr)}, std::make_shared<NullLogger>()).ToSql().value().sql;
  return sql.substr(std::string{"SELECT "}.size());
}

}  // namespace

TEST(FunctionsTest, Aggregates) {
  ASSERT_THAT(Render(fn::Count()), testing::Eq("count(*)"));
  ASSERT_THAT(Render(fn::Count("id")), testing::Eq("count(`id`)"));
  ASSERT_THAT(Render(fn::Sum("amount")), testing::Eq("sum(`amount`)"));
  ASSERT_THAT(Render(fn::Avg("amount")), testing::Eq("avg(`amount`)"));
  ASSERT_THAT(Render(fn::Max("o.total")), testing::Eq("max(`o`.`total`)"));
  ASSERT_THAT(Render(fn::CountDistinct("user_id")), testing::Eq("count(distinct(`user_id`))"));
  ASSERT_THAT(Render(fn::UniqExact("user_id")), testing::Eq("uniqExact(`user_id`)"));
  ASSERT_THAT(Render(fn::GroupArray("tag")), testing::Eq("groupArray(`tag`)"));
  ASSERT_THAT(Render(fn::Median("latency")), testing::Eq("median(`latency`)"));
}

TEST(FunctionsTest, QuantileTakesLevelAsParameter) {
  ASSERT_THAT(Render(fn::Quantile(0.95, "latency")), testing::Eq("quantile(0.95)(`latency`)"));
}

TEST(FunctionsTest, StringFunctions) {
  ASSERT_THAT(Render(fn::Concat({"first", Value(" "), "last"})), testing::Eq("concat(`first`, ' ', `last`)"));
  ASSERT_THAT(Render(fn::Upper("name")), testing::Eq("upper(`name`)"));
  ASSERT_THAT(Render(fn::Trim("name")), testing::Eq("trim(`name`)"));
  ASSERT_THAT(Render(fn::Substring("name", 1, 3)), testing::Eq("substring(`name`, 1, 3)"));
  ASSERT_THAT(Render(fn::Substring("name", 2)), testing::Eq("substring(`name`, 2)"));
}

TEST(FunctionsTest, MathFunctions) {
  ASSERT_THAT(Render(fn::Round("price", 2)), testing::Eq("round(`price`, 2)"));
  ASSERT_THAT(Render(fn::Round("price")), testing::Eq("round(`price`, 0)"));
  ASSERT_THAT(Render(fn::Abs("delta")), testing::Eq("abs(`delta`)"));
}

TEST(FunctionsTest, ConditionalFunctions) {
  ASSERT_THAT(Render(fn::If("amount > 100", Value("big"), Value("small"))),
              testing::Eq("if(amount > 100, 'big', 'small')"));
  ASSERT_THAT(Render(fn::Coalesce({"nickname", Value("anon")})), testing::Eq("coalesce(`nickname`, 'anon')"));
}

TEST(FunctionsTest, DateFunctions) {
  ASSERT_THAT(Render(fn::Now()), testing::Eq("now()"));
  ASSERT_THAT(Render(fn::Today()), testing::Eq("today()"));
  ASSERT_THAT(Render(fn::ToDate("created_at")), testing::Eq("toDate(`created_at`)"));
  ASSERT_THAT(Render(fn::FormatDateTime("created_at", "%Y-%m-%d")),
              testing::Eq("formatDateTime(`created_at`, '%Y-%m-%d')"));
}

TEST(FunctionsTest, ArrayFunctions) {
  ASSERT_THAT(Render(fn::ArrayElement("tags", 1)), testing::Eq("arrayElement(`tags`, 1)"));
  ASSERT_THAT(Render(fn::ArrayLength("tags")), testing::Eq("length(`tags`)"));
  ASSERT_THAT(Render(fn::ArrayJoin("tags")), testing::Eq("arrayStringConcat(`tags`, ',')"));
  ASSERT_THAT(Render(fn::ArrayJoin("tags", "|")), testing::Eq("arrayStringConcat(`tags`, '|')"));
}

TEST(FunctionsTest, TypeConversions) {
  ASSERT_THAT(Render(fn::Cast("id", "String")), testing::Eq("CAST(`id` AS String)"));
  ASSERT_THAT(Render(fn::ToString("id")), testing::Eq("toString(`id`)"));
  ASSERT_THAT(Render(fn::ToInt("value")), testing::Eq("toInt32(`value`)"));
  ASSERT_THAT(Render(fn::ToFloat("value")), testing::Eq("toFloat64(`value`)"));
}

TEST(FunctionsTest, AliasedFunction) {
  ASSERT_THAT(Render(As(fn::Sum("amount"), "total")), testing::Eq("sum(`amount`) AS `total`"));
}

TEST(FunctionsTest, NestedFunctions) {
  ASSERT_THAT(Render(fn::Round(fn::Avg("price"), 2)), testing::Eq("round(avg(`price`), 2)"));
}

TEST(FunctionsTest, InvalidFunctionNameFailsCompilation) {
  auto got = Select({fn::Call("drop table", {})}, std::make_shared<NullLogger>()).ToSql();

  ASSERT_THAT(got.has_value(), IsFalse());
  ASSERT_THAT(got.error().What(), HasSubstr("Invalid function name 'drop table'"));
}

}  // namespace chq
