#pragma once

#include <concepts>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include <chq/logic/builder/functions.hpp>
#include <chq/logic/builder/query_builder.hpp>
#include <chq/logic/runner/query_runner.hpp>
#include <chq/models/builder/ast.hpp>
#include <chq/models/builder/operators.hpp>

namespace chq {

class SelectBuilder;

// SELECT list entry: a column name, any expression, or a nested builder used
// as a scalar subquery.
struct SelectItem {
    template <typename T>
        requires std::constructible_from<ExprArg, T&&>
    SelectItem(T&& item) : expr(ExprArg(std::forward<T>(item)).expr) {}
    SelectItem(const SelectBuilder& builder);

    Expr expr;
};

struct OrderItem {
    std::string column;
    Direction direction = Direction::kAsc;
};

class SelectBuilder : public QueryBuilder<SelectBuilder, SelectNode> {
public:
  explicit SelectBuilder(std::vector<SelectItem> columns = {}, std::shared_ptr<Logger> logger = nullptr);

  SelectBuilder& With(std::string alias, Subquery query);
  SelectBuilder& With(std::string alias, const SelectBuilder& query);

  SelectBuilder& From(TableSource table, std::optional<std::string> alias = std::nullopt);
  SelectBuilder& From(const SelectBuilder& query, std::optional<std::string> alias = std::nullopt);

  SelectBuilder& Join(JoinType type, TableSource table, const Condition& on,
                      std::optional<std::string> alias = std::nullopt);
  SelectBuilder& InnerJoin(TableSource table, const Condition& on, std::optional<std::string> alias = std::nullopt);
  SelectBuilder& LeftJoin(TableSource table, const Condition& on, std::optional<std::string> alias = std::nullopt);
  SelectBuilder& RightJoin(TableSource table, const Condition& on, std::optional<std::string> alias = std::nullopt);
  SelectBuilder& FullJoin(TableSource table, const Condition& on, std::optional<std::string> alias = std::nullopt);

  SelectBuilder& Prewhere(WhereRecord record);
  SelectBuilder& Prewhere(Combinator combinator);
  SelectBuilder& Prewhere(RawExpr raw);

  // Repeated calls are AND-combined.
  SelectBuilder& Where(WhereRecord record);
  SelectBuilder& Where(Combinator combinator);
  SelectBuilder& Where(RawExpr raw);

  SelectBuilder& GroupBy(std::vector<std::string> columns);

  SelectBuilder& Having(WhereRecord record);
  SelectBuilder& Having(Combinator combinator);
  SelectBuilder& Having(RawExpr raw);

  SelectBuilder& OrderBy(std::vector<OrderItem> specs);
  SelectBuilder& Limit(std::int64_t limit, std::optional<std::int64_t> offset = std::nullopt);
  SelectBuilder& Final();
  SelectBuilder& Settings(Map settings);
  // Output format requested from the runner, not rendered into the SQL.
  SelectBuilder& Format(std::string format);

  SelectBuilder& Union(const SelectBuilder& query);
  SelectBuilder& UnionAll(const SelectBuilder& query);

  Subquery AsSubquery(std::optional<std::string> alias = std::nullopt) const;

  boost::asio::awaitable<Result<Rows>> Run(QueryRunner& runner) const;
  // Only streamable formats are accepted, JSONEachRow when no format is set.
  boost::asio::awaitable<Result<std::unique_ptr<ResultStream>>> Stream(QueryRunner& runner) const;
};

SelectBuilder Select(std::vector<SelectItem> columns = {}, std::shared_ptr<Logger> logger = nullptr);

}  // namespace chq
