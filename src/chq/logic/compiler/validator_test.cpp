#include <gmock/gmock.h>

#include <memory>

#include <chq/logic/builder/select_builder.hpp>
#include <chq/logic/compiler/validator.hpp>

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::IsFalse;
using ::testing::IsTrue;
using ::testing::SizeIs;

namespace chq {

namespace {

constexpr char kRawWarning[] = "Raw SQL expression used - ensure it is safe from SQL injection";

Validator MakeValidator() { return Validator{std::make_shared<NullLogger>()}; }

Subquery SubqueryOf(SelectNode node) { return Subquery(std::make_shared<const SelectNode>(std::move(node))); }

PredicateNode Compare(std::string column, std::string op, Value value) {
  return Predicate{.left = Col(column), .op = std::move(op), .right = ValueExpr{.value = std::move(value)}};
}

}  // namespace

TEST(ValidatorTest, ValidSelect) {
  SelectNode node{.columns = {Col("id")}, .from = FromClause{.table = "users"}};
  node.where = Compare("age", ">", 18);

  auto got = MakeValidator().ValidateQuery(node);

  ASSERT_THAT(got.valid, IsTrue());
  ASSERT_THAT(got.errors, IsEmpty());
  ASSERT_THAT(got.warnings, IsEmpty());
}

TEST(ValidatorTest, EmptyTableName) {
  auto got = MakeValidator().ValidateQuery(DeleteNode{.table = ""});

  ASSERT_THAT(got.valid, IsFalse());
  ASSERT_THAT(got.errors, ElementsAre("Invalid table identifier: must be a non-empty string"));
}

TEST(ValidatorTest, EmptyColumnInPredicate) {
  SelectNode node{.from = FromClause{.table = "users"}};
  node.where = Compare("", "=", 1);

  auto got = MakeValidator().ValidateQuery(node);

  ASSERT_THAT(got.errors, ElementsAre("Invalid column identifier: must be a non-empty string"));
}

TEST(ValidatorTest, ExistsHasNoLeftColumn) {
  SelectNode node{.from = FromClause{.table = "users"}};
  node.where = Predicate{
      .left = NoColumn(),
      .op = "EXISTS",
      .right = SubqueryOf(SelectNode{.from = FromClause{.table = "orders"}}),
  };

  auto got = MakeValidator().ValidateQuery(node);

  ASSERT_THAT(got.valid, IsTrue());
}

TEST(ValidatorTest, SettingNamesMustBeSimpleIdentifiers) {
  auto got = MakeValidator().ValidateQuery(
      DeleteNode{.table = "t", .settings = {{"max_threads", 4}, {"bad key; DROP", 1}}});

  ASSERT_THAT(got.errors, ElementsAre("Invalid setting name 'bad key; DROP'"));
}

TEST(ValidatorTest, RawSqlProducesWarningOnly) {
  SelectNode node{.columns = {RawExpr{.sql = "count() * 2"}}, .from = FromClause{.table = "t"}};
  node.where = RawPredicate{.sql = "x > 1"};

  auto got = MakeValidator().ValidateQuery(node);

  ASSERT_THAT(got.valid, IsTrue());
  ASSERT_THAT(got.warnings, SizeIs(2));
  ASSERT_THAT(got.warnings, testing::Contains(kRawWarning));
}

TEST(ValidatorTest, NestedSubqueryErrorsArePrefixed) {
  SelectNode node{.from = FromClause{.table = SubqueryOf(SelectNode{.from = FromClause{.table = ""}})}};

  auto got = MakeValidator().ValidateQuery(node);

  ASSERT_THAT(got.errors,
              ElementsAre("Subquery validation failed: Invalid table identifier: must be a non-empty string"));
}

TEST(ValidatorTest, FunctionArgumentErrorsArePrefixed) {
  SelectNode node{.columns = {FunctionCall{.name = "sum", .args = {Col("")}}}, .from = FromClause{.table = "t"}};

  auto got = MakeValidator().ValidateQuery(node);

  ASSERT_THAT(got.errors,
              ElementsAre("Function argument 0: Invalid column identifier: must be a non-empty string"));
}

TEST(ValidatorTest, CaseWithoutBranches) {
  auto got = MakeValidator().ValidateExpression(CaseExpr{});

  ASSERT_THAT(got.errors, ElementsAre("CASE expression requires at least one WHEN branch"));
}

TEST(ValidatorTest, CaseWithIncompleteBranch) {
  CaseExpr expr{.branches = {CaseBranch{.then = std::make_shared<const Expr>(ValueExpr{.value = 1})},
                             CaseBranch{.condition = std::make_shared<const PredicateNode>(
                                            Compare("a", "=", 1))}}};

  auto got = MakeValidator().ValidateExpression(expr);

  ASSERT_THAT(got.valid, IsFalse());
  ASSERT_THAT(got.errors, ElementsAre("CASE branch 0 is incomplete", "CASE branch 1 is incomplete"));
}

TEST(ValidatorTest, SelectWithIncompleteCaseFailsToCompile) {
  CaseExpr expr{.branches = {CaseBranch{}}};

  auto got = Select({expr}, std::make_shared<NullLogger>()).From("t").ToSql();

  ASSERT_THAT(got.has_value(), IsFalse());
  ASSERT_THAT(got.error().What(), testing::HasSubstr("CASE branch 0 is incomplete"));
}

TEST(ValidatorTest, EmptyAlias) {
  auto got = MakeValidator().ValidateExpression(ColumnRef{.name = "id", .alias = ""});

  ASSERT_THAT(got.errors, ElementsAre("Invalid alias identifier: must be a non-empty string"));
}

TEST(ValidatorTest, NegativeLimitAndOffset) {
  SelectNode node{.from = FromClause{.table = "t"}, .limit = -1, .offset = -5};

  auto got = MakeValidator().ValidateQuery(node);

  ASSERT_THAT(got.errors, ElementsAre("LIMIT must be non-negative", "OFFSET must be non-negative"));
}

TEST(ValidatorTest, CollectsAllErrors) {
  SelectNode node{.columns = {Col("")}, .from = FromClause{.table = "", .alias = ""}};

  auto got = MakeValidator().ValidateQuery(node);

  ASSERT_THAT(got.errors, SizeIs(3));
}

TEST(ValidatorTest, InsertRowWidthMustMatchColumns) {
  InsertNode node{.table = "users", .columns = {"id", "name"}, .values = {{1, "a"}, {2}}};

  auto got = MakeValidator().ValidateQuery(node);

  ASSERT_THAT(got.errors, ElementsAre("Row 1 has 1 values, expected 2"));
}

TEST(ValidatorTest, UpdateRequiresAssignments) {
  auto got = MakeValidator().ValidateQuery(UpdateNode{.table = "users"});

  ASSERT_THAT(got.errors, ElementsAre("UPDATE requires at least one SET assignment"));
}

TEST(ValidatorTest, UpdateSetKeysMustBeNonEmpty) {
  auto got = MakeValidator().ValidateQuery(UpdateNode{.table = "users", .set = {{"", 1}}});

  ASSERT_THAT(got.errors, ElementsAre("Invalid column identifier: must be a non-empty string"));
}

TEST(ValidatorTest, LoweringErrorsAreReported) {
  auto got = MakeValidator().ValidateQuery(DeleteNode{.table = "t", .lowering_errors = {"WHERE: broken"}});

  ASSERT_THAT(got.errors, ElementsAre("WHERE: broken"));
}

TEST(ValidatorTest, IdentifierKindIsNamed) {
  auto got = MakeValidator().ValidateIdentifier("", "CTE alias");

  ASSERT_THAT(got.errors, ElementsAre("Invalid CTE alias identifier: must be a non-empty string"));
  ASSERT_THAT(MakeValidator().ValidateIdentifier("users", "table").valid, testing::Eq(true));
}

}  // namespace chq
