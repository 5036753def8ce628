#include <gmock/gmock.h>

#include <memory>

#include <chq/logic/compiler/renderer.hpp>
#include <chq/logic/result/error.hpp>

using ::testing::HasSubstr;
using ::testing::IsFalse;
using ::testing::IsTrue;

namespace chq {

namespace {

ClickHouseRenderer MakeRenderer() { return ClickHouseRenderer{std::make_shared<NullLogger>()}; }

QueryIR SelectFrom(std::string table) { return QueryIR{.type = QueryType::kSelect, .table = TableSourceIR{table}}; }

NormalizedPredicateNode Compare(std::string left, std::string op, PredicateOperand right) {
  return NormalizedPredicate{.left = std::move(left), .op = std::move(op), .right = std::move(right)};
}

std::string RenderWhere(NormalizedPredicateNode predicate) {
  auto query = SelectFrom("t");
  query.predicates.push_back(std::move(predicate));
  auto sql = MakeRenderer().Render(query).value().sql;
  return sql.substr(std::string{"SELECT * FROM `t` WHERE "}.size());
}

}  // namespace

TEST(QuoteIdentifierTest, QuotesPlainAndQualifiedNames) {
  EXPECT_THAT(QuoteIdentifier("id"), testing::Eq("`id`"));
  EXPECT_THAT(QuoteIdentifier("users.id"), testing::Eq("`users`.`id`"));
  EXPECT_THAT(QuoteIdentifier("order"), testing::Eq("`order`"));
}

TEST(QuoteIdentifierTest, LeavesStarAndNumbersBare) {
  EXPECT_THAT(QuoteIdentifier("*"), testing::Eq("*"));
  EXPECT_THAT(QuoteIdentifier("42"), testing::Eq("42"));
  EXPECT_THAT(QuoteIdentifier("3.14"), testing::Eq("3.14"));
}

TEST(QuoteIdentifierTest, FunctionTextDependsOnContext) {
  EXPECT_THAT(QuoteIdentifier("count()", QuoteContext::kSelect), testing::Eq("count()"));
  EXPECT_THAT(QuoteIdentifier("count()", QuoteContext::kPredicate), testing::Eq("`count()`"));
}

TEST(QuoteIdentifierTest, EscapesBackticksAndBackslashes) {
  EXPECT_THAT(QuoteIdentifier("we`ird"), testing::Eq("`we\\`ird`"));
  EXPECT_THAT(QuoteIdentifier("back\\slash"), testing::Eq("`back\\\\slash`"));
}

TEST(QuoteIdentifierTest, RejectsMalformedQualifiedNames) {
  EXPECT_THROW(QuoteIdentifier("a.b.c"), Error);
  EXPECT_THROW(QuoteIdentifier("a.b-c"), Error);
  EXPECT_THROW(QuoteIdentifier(".id"), Error);
}

TEST(QuoteIdentifierTest, SimpleIdentifiers) {
  EXPECT_THAT(IsSimpleIdentifier("max_threads"), IsTrue());
  EXPECT_THAT(IsSimpleIdentifier("_x1"), IsTrue());
  EXPECT_THAT(IsSimpleIdentifier("1x"), IsFalse());
  EXPECT_THAT(IsSimpleIdentifier("a b"), IsFalse());
  EXPECT_THAT(IsSimpleIdentifier(""), IsFalse());
}

TEST(RendererTest, ComparisonOperators) {
  EXPECT_THAT(RenderWhere(Compare("age", ">=", Value{18})), testing::Eq("`age` >= 18"));
  EXPECT_THAT(RenderWhere(Compare("name", "LIKE", Value{"J%"})), testing::Eq("`name` LIKE 'J%'"));
  EXPECT_THAT(RenderWhere(Compare("u.id", "=", ColumnOperand{"o.user_id"})), testing::Eq("`u`.`id` = `o`.`user_id`"));
}

TEST(RendererTest, ListOperators) {
  EXPECT_THAT(RenderWhere(Compare("id", "IN", Array{1, 2})), testing::Eq("`id` IN (1, 2)"));
  EXPECT_THAT(RenderWhere(Compare("id", "NOT IN", Array{"a"})), testing::Eq("`id` NOT IN ('a')"));
  EXPECT_THAT(RenderWhere(Compare("id", "IN", Array{})), testing::Eq("`id` IN (SELECT 1 WHERE 0=1)"));
}

TEST(RendererTest, BetweenAndNullChecks) {
  EXPECT_THAT(RenderWhere(Compare("age", "BETWEEN", Array{18, 65})), testing::Eq("`age` BETWEEN 18 AND 65"));
  EXPECT_THAT(RenderWhere(Compare("email", "IS NULL", Value{})), testing::Eq("`email` IS NULL"));
  EXPECT_THAT(RenderWhere(Compare("email", "IS NOT NULL", Value{})), testing::Eq("`email` IS NOT NULL"));
}

TEST(RendererTest, ArrayOperators) {
  EXPECT_THAT(RenderWhere(Compare("tags", "HAS ANY", Array{"a", "b"})),
              testing::Eq("arrayExists(`i` -> (`i` IN ('a', 'b')), `tags`)"));
  EXPECT_THAT(RenderWhere(Compare("tags", "HAS ALL", Array{"a"})), testing::Eq("arrayAll(`i` -> (`i` IN ('a')), `tags`)"));
}

TEST(RendererTest, ExistsRendersSubqueryOnly) {
  auto sub = std::make_shared<const QueryIR>(SelectFrom("orders"));

  EXPECT_THAT(RenderWhere(Compare("", "EXISTS", SubqueryIR{sub})), testing::Eq("EXISTS (SELECT * FROM `orders`)"));
  EXPECT_THAT(RenderWhere(Compare("", "NOT EXISTS", SubqueryIR{sub})), testing::Eq("NOT EXISTS (SELECT * FROM `orders`)"));
}

TEST(RendererTest, BooleanTreeParentheses) {
  auto a = Compare("a", "=", Value{1});
  auto b = Compare("b", "=", Value{2});
  auto c = Compare("c", "=", Value{3});

  EXPECT_THAT(RenderWhere(NormalizedAndPredicate{.children = {a, b}, .from_combinator = true}),
              testing::Eq("`a` = 1 AND `b` = 2"));
  EXPECT_THAT(RenderWhere(NormalizedOrPredicate{.children = {a, b}}), testing::Eq("(`a` = 1 OR `b` = 2)"));
  EXPECT_THAT(RenderWhere(NormalizedAndPredicate{
                  .children = {a, NormalizedAndPredicate{.children = {b, c}, .from_combinator = true}}}),
              testing::Eq("`a` = 1 AND (`b` = 2 AND `c` = 3)"));
  EXPECT_THAT(RenderWhere(NormalizedNotPredicate{
                  .child = std::make_shared<const NormalizedPredicateNode>(NormalizedOrPredicate{.children = {a, b}})}),
              testing::Eq("NOT ((`a` = 1 OR `b` = 2))"));
  EXPECT_THAT(RenderWhere(NormalizedNotPredicate{.child = std::make_shared<const NormalizedPredicateNode>(a)}),
              testing::Eq("NOT (`a` = 1)"));
}

TEST(RendererTest, UnknownOperatorFails) {
  auto query = SelectFrom("t");
  query.predicates.push_back(Compare("a", "<=>", Value{1}));

  auto got = MakeRenderer().Render(query);

  ASSERT_THAT(got.has_value(), IsFalse());
  ASSERT_THAT(got.error().What(), testing::Eq("Unsupported operator: <=>"));
}

TEST(RendererTest, InvalidIdentifierFails) {
  auto got = MakeRenderer().Render(SelectFrom("db.schema.table"));

  ASSERT_THAT(got.has_value(), IsFalse());
  ASSERT_THAT(got.error().What(), HasSubstr("table.column format expected"));
}

TEST(RendererTest, SelectClauseOrder) {
  auto query = SelectFrom("events");
  query.columns = {ExprIR{.node = ColumnIR{"id"}}};
  query.predicates.push_back(Compare("a", "=", Value{1}));
  auto prewhere = Compare("date", ">", Value{"2024-01-01"});
  MarkPrewhere(prewhere);
  query.predicates.insert(query.predicates.begin(), prewhere);
  query.group_by = {"id"};
  query.having = {Compare("id", ">", Value{0})};
  query.order_by = {OrderIR{.column = "id", .direction = Direction::kAsc}};
  query.limit = 10;
  query.offset = 5;
  query.final = true;
  query.settings = {{"max_threads", 2}};

  auto got = MakeRenderer().Render(query).value();

  EXPECT_THAT(got.sql, testing::Eq("SELECT `id` FROM `events` PREWHERE `date` > '2024-01-01' WHERE `a` = 1 GROUP BY `id` "
                          "HAVING `id` > 0 ORDER BY `id` ASC LIMIT 10 OFFSET 5 FINAL SETTINGS max_threads = 2"));
  EXPECT_THAT(got.params.empty(), IsTrue());
}

TEST(RendererTest, ZeroLimitIsOmitted) {
  auto query = SelectFrom("t");
  query.limit = 0;
  query.offset = 5;

  EXPECT_THAT(MakeRenderer().Render(query).value().sql, testing::Eq("SELECT * FROM `t`"));
}

TEST(RendererTest, Mutations) {
  QueryIR update{.type = QueryType::kUpdate, .table = TableSourceIR{std::string{"users"}}};
  update.set = {{"status", "it's"}, {"score", 1.5}};
  QueryIR remove{.type = QueryType::kDelete, .table = TableSourceIR{std::string{"users"}}};

  EXPECT_THAT(MakeRenderer().Render(update).value().sql,
              testing::Eq("ALTER TABLE `users` UPDATE `status` = 'it''s', `score` = 1.5"));
  EXPECT_THAT(MakeRenderer().Render(remove).value().sql, testing::Eq("ALTER TABLE `users` DELETE"));
}

TEST(RendererTest, Insert) {
  QueryIR insert{.type = QueryType::kInsert, .table = TableSourceIR{std::string{"users"}}};
  insert.insert_columns = {"id", "name"};
  insert.values = {{1, "a"}, {2, nullptr}};

  EXPECT_THAT(MakeRenderer().Render(insert).value().sql,
              testing::Eq("INSERT INTO `users` (`id`, `name`) VALUES (1, 'a'), (2, NULL)"));
}

}  // namespace chq
