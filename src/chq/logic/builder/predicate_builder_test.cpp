#include <gmock/gmock.h>

#include <string>
#include <variant>

#include <chq/logic/builder/predicate_builder.hpp>
#include <chq/logic/builder/select_builder.hpp>
#include <chq/logic/result/error.hpp>

using ::testing::IsFalse;
using ::testing::IsTrue;
using ::testing::Optional;
using ::testing::SizeIs;

namespace chq {

namespace {

const Predicate& AsPredicate(const PredicateNode& node) { return std::get<Predicate>(node); }

std::string LeftName(const PredicateNode& node) { return std::get<ColumnRef>(AsPredicate(node).left).name; }

}  // namespace

TEST(PredicateBuilderTest, ComparisonOperators) {
  ASSERT_THAT(AsPredicate(OperatorToPredicate("age", Eq(18))).op, testing::Eq("="));
  ASSERT_THAT(AsPredicate(OperatorToPredicate("age", Ne(18))).op, testing::Eq("!="));
  ASSERT_THAT(AsPredicate(OperatorToPredicate("age", Gt(18))).op, testing::Eq(">"));
  ASSERT_THAT(AsPredicate(OperatorToPredicate("age", Gte(18))).op, testing::Eq(">="));
  ASSERT_THAT(AsPredicate(OperatorToPredicate("age", Lt(18))).op, testing::Eq("<"));
  ASSERT_THAT(AsPredicate(OperatorToPredicate("age", Lte(18))).op, testing::Eq("<="));

  auto got = AsPredicate(OperatorToPredicate("age", Gt(18)));
  ASSERT_THAT(std::get<ValueExpr>(got.right).value, testing::Eq(Value{18}));
}

TEST(PredicateBuilderTest, QualifiedColumnIsSplit) {
  auto got = AsPredicate(OperatorToPredicate("users.id", EqCol("orders.user_id")));

  auto left = std::get<ColumnRef>(got.left);
  auto right = std::get<ColumnRef>(got.right);
  ASSERT_THAT(left.table, testing::Eq(std::optional<std::string>{"users"}));
  ASSERT_THAT(left.name, testing::Eq("id"));
  ASSERT_THAT(right.table, testing::Eq(std::optional<std::string>{"orders"}));
  ASSERT_THAT(right.name, testing::Eq("user_id"));
}

TEST(PredicateBuilderTest, ListAndRangeOperators) {
  auto in = AsPredicate(OperatorToPredicate("id", In({1, 2, 3})));
  auto between = AsPredicate(OperatorToPredicate("age", Between(18, 65)));
  auto has_any = AsPredicate(OperatorToPredicate("tags", HasAny({"a", "b"})));

  ASSERT_THAT(in.op, testing::Eq("IN"));
  ASSERT_THAT(std::get<ArrayExpr>(in.right).values, SizeIs(3));
  ASSERT_THAT(between.op, testing::Eq("BETWEEN"));
  ASSERT_THAT(std::get<TupleExpr>(between.right).values, testing::Eq(Array{18, 65}));
  ASSERT_THAT(has_any.op, testing::Eq("HAS ANY"));
}

TEST(PredicateBuilderTest, NullChecks) {
  ASSERT_THAT(AsPredicate(OperatorToPredicate("email", IsNull())).op, testing::Eq("IS NULL"));
  ASSERT_THAT(AsPredicate(OperatorToPredicate("email", IsNotNull())).op, testing::Eq("IS NOT NULL"));
}

TEST(PredicateBuilderTest, ExistsTakesSubqueryWithoutColumn) {
  auto sub = Select({"id"}).From("orders");

  auto got = AsPredicate(OperatorToPredicate("", Exists(Subquery(sub))));

  ASSERT_THAT(got.op, testing::Eq("EXISTS"));
  ASSERT_THAT(std::get<ColumnRef>(got.left).name, testing::Eq(""));
  ASSERT_THAT(std::holds_alternative<Subquery>(got.right), IsTrue());
}

TEST(PredicateBuilderTest, ExistsRejectsLiteral) {
  try {
    OperatorToPredicate("", Exists(1));
    FAIL() << "literal EXISTS operand was accepted";
  } catch (const Error& error) {
    ASSERT_THAT(error.What(), testing::Eq("EXISTS operator requires a subquery"));
    ASSERT_THAT(error.Type(), testing::Eq(ErrorType::kValidation));
  }
}

TEST(PredicateBuilderTest, BetweenNeedsExactlyTwoValues) {
  Operator op{OperatorType::kBetween, Array{1}};

  ASSERT_THROW(OperatorToPredicate("age", op), Error);
}

TEST(PredicateBuilderTest, ComparisonRejectsListOperand) {
  Operator op{OperatorType::kLike, Array{"a%", "b%"}};

  try {
    OperatorToPredicate("name", op);
    FAIL() << "list operand was accepted by LIKE";
  } catch (const Error& error) {
    ASSERT_THAT(error.What(), testing::Eq("Operator like expects a single value"));
    ASSERT_THAT(error.Details().field, Optional(std::string{"operator"}));
  }
}

TEST(PredicateBuilderTest, InRejectsScalarAndColumnOperands) {
  Operator scalar{OperatorType::kIn, Value(1)};
  Operator column{OperatorType::kNotIn, ColumnName{"other"}};

  try {
    OperatorToPredicate("id", scalar);
    FAIL() << "scalar operand was accepted by IN";
  } catch (const Error& error) {
    ASSERT_THAT(error.What(), testing::Eq("Operator in expects a list of values"));
  }
  ASSERT_THROW(OperatorToPredicate("id", column), Error);
}

TEST(PredicateBuilderTest, ComparisonRejectsMissingOperand) {
  Operator op{OperatorType::kEq, std::monostate{}};

  ASSERT_THROW(OperatorToPredicate("id", op), Error);
}

TEST(PredicateBuilderTest, SingleEntryRecordIsSinglePredicate) {
  auto got = BuildPredicate({{"id", Eq(1)}});

  ASSERT_THAT(std::holds_alternative<Predicate>(got), IsTrue());
  ASSERT_THAT(LeftName(got), testing::Eq("id"));
}

TEST(PredicateBuilderTest, RecordEntriesAreAndCombined) {
  auto got = BuildPredicate({{"status", Eq("active")}, {"age", Gt(18)}});

  const auto& group = std::get<AndPredicate>(got);
  ASSERT_THAT(group.from_combinator, IsFalse());
  ASSERT_THAT(group.children, SizeIs(2));
  ASSERT_THAT(LeftName(group.children[0]), testing::Eq("status"));
  ASSERT_THAT(LeftName(group.children[1]), testing::Eq("age"));
}

TEST(PredicateBuilderTest, EmptyRecordIsRejected) { ASSERT_THROW(BuildPredicate({}), Error); }

TEST(PredicateBuilderTest, CombinatorDistributesColumn) {
  auto got = ApplyColumnToCombinator("price", And(Gt(10), Lt(100)));

  const auto& group = std::get<AndPredicate>(got);
  ASSERT_THAT(group.from_combinator, IsTrue());
  ASSERT_THAT(group.children, SizeIs(2));
  ASSERT_THAT(LeftName(group.children[0]), testing::Eq("price"));
  ASSERT_THAT(AsPredicate(group.children[1]).op, testing::Eq("<"));
}

TEST(PredicateBuilderTest, NestedCombinatorKeepsColumn) {
  auto got = ApplyColumnToCombinator("status", Or(Eq("new"), Not(Eq("closed"))));

  const auto& group = std::get<OrPredicate>(got);
  ASSERT_THAT(group.children, SizeIs(2));
  const auto& negated = std::get<NotPredicate>(group.children[1]);
  ASSERT_THAT(LeftName(*negated.child), testing::Eq("status"));
}

TEST(PredicateBuilderTest, NestedRecordUsesItsOwnColumn) {
  auto got = ApplyColumnToCombinator("age", Or(Gt(65), WhereRecord{{"vip", Eq(true)}}));

  const auto& group = std::get<OrPredicate>(got);
  ASSERT_THAT(LeftName(group.children[0]), testing::Eq("age"));
  ASSERT_THAT(LeftName(group.children[1]), testing::Eq("vip"));
}

TEST(PredicateBuilderTest, BareOperatorInBareCombinatorIsRejected) {
  try {
    CombinatorToPredicate(And(Gt(10)));
    FAIL() << "bare operator was accepted";
  } catch (const Error& error) {
    ASSERT_THAT(error.What(), testing::Eq("Cannot use a bare Operator without a column, pair it with a column name"));
  }
}

TEST(PredicateBuilderTest, RawConditionBecomesRawPredicate) {
  auto got = ConditionToPredicate(Raw("length(name) > 3"));

  ASSERT_THAT(std::get<RawPredicate>(got).sql, testing::Eq("length(name) > 3"));
}

TEST(PredicateBuilderTest, EmptyCombinatorIsRejected) {
  ASSERT_THROW(CombinatorToPredicate(Or(std::vector<Condition>{})), Error);
}

TEST(PredicateBuilderTest, MergeAndFlattensImplicitGroups) {
  auto first = BuildPredicate({{"a", Eq(1)}, {"b", Eq(2)}});
  auto second = BuildPredicate({{"c", Eq(3)}});

  auto got = MergeAnd(first, second);

  const auto& group = std::get<AndPredicate>(got);
  ASSERT_THAT(group.from_combinator, IsFalse());
  ASSERT_THAT(group.children, SizeIs(3));
}

TEST(PredicateBuilderTest, MergeAndKeepsExplicitGroups) {
  auto first = BuildPredicate({{"a", Eq(1)}});
  auto second = CombinatorToPredicate(And({{"b", Eq(2)}, {"c", Eq(3)}}));

  auto got = MergeAnd(first, second);

  const auto& group = std::get<AndPredicate>(got);
  ASSERT_THAT(group.children, SizeIs(2));
  ASSERT_THAT(std::get<AndPredicate>(group.children[1]).from_combinator, IsTrue());
}

TEST(PredicateBuilderTest, MergeAndWithoutCurrentReturnsNext) {
  auto got = MergeAnd(std::nullopt, BuildPredicate({{"a", Eq(1)}}));

  ASSERT_THAT(LeftName(got), testing::Eq("a"));
}

}  // namespace chq
