#include <chq/logic/builder/select_builder.hpp>

#include <string>
#include <utility>
#include <variant>

namespace chq {

SelectItem::SelectItem(const SelectBuilder& builder) : expr(Subquery(builder)) {}

Subquery::Subquery(const SelectBuilder& builder)
    : query(std::make_shared<const SelectNode>(builder.GetNode())) {}

SelectBuilder::SelectBuilder(std::vector<SelectItem> columns, std::shared_ptr<Logger> logger)
    : QueryBuilder(SelectNode{}, std::move(logger), "SelectBuilder") {
  node_.columns.reserve(columns.size());
  for (auto& column : columns) {
    node_.columns.push_back(std::move(column.expr));
  }
  log_.Debug("creating SELECT query with " + std::to_string(node_.columns.size()) + " columns");
}

SelectBuilder& SelectBuilder::With(std::string alias, Subquery query) {
  node_.with.push_back(WithClause{.alias = std::move(alias), .query = std::move(query)});
  return *this;
}

SelectBuilder& SelectBuilder::With(std::string alias, const SelectBuilder& query) {
  return With(std::move(alias), Subquery(query));
}

SelectBuilder& SelectBuilder::From(TableSource table, std::optional<std::string> alias) {
  log_.Debug(std::holds_alternative<std::string>(table) ? "adding FROM " + std::get<std::string>(table)
                                                         : std::string{"adding FROM subquery"});
  node_.from = FromClause{.table = std::move(table), .alias = std::move(alias)};
  return *this;
}

SelectBuilder& SelectBuilder::From(const SelectBuilder& query, std::optional<std::string> alias) {
  return From(TableSource{Subquery(query)}, std::move(alias));
}

SelectBuilder& SelectBuilder::Join(JoinType type, TableSource table, const Condition& on,
                                   std::optional<std::string> alias) {
  log_.Debug("adding " + ToString(type) + " JOIN");
  auto predicate = Lower(on, "JOIN");
  if (!predicate) {
    return *this;
  }
  node_.joins.push_back(JoinSpec{
      .type = type,
      .table = std::move(table),
      .alias = std::move(alias),
      .on = std::move(*predicate),
  });
  return *this;
}

SelectBuilder& SelectBuilder::InnerJoin(TableSource table, const Condition& on, std::optional<std::string> alias) {
  return Join(JoinType::kInner, std::move(table), on, std::move(alias));
}

SelectBuilder& SelectBuilder::LeftJoin(TableSource table, const Condition& on, std::optional<std::string> alias) {
  return Join(JoinType::kLeft, std::move(table), on, std::move(alias));
}

SelectBuilder& SelectBuilder::RightJoin(TableSource table, const Condition& on, std::optional<std::string> alias) {
  return Join(JoinType::kRight, std::move(table), on, std::move(alias));
}

SelectBuilder& SelectBuilder::FullJoin(TableSource table, const Condition& on, std::optional<std::string> alias) {
  return Join(JoinType::kFull, std::move(table), on, std::move(alias));
}

SelectBuilder& SelectBuilder::Prewhere(WhereRecord record) {
  node_.prewhere = Lower(Condition(std::move(record)), "PREWHERE");
  return *this;
}

SelectBuilder& SelectBuilder::Prewhere(Combinator combinator) {
  node_.prewhere = Lower(Condition(std::move(combinator)), "PREWHERE");
  return *this;
}

SelectBuilder& SelectBuilder::Prewhere(RawExpr raw) {
  node_.prewhere = Lower(Condition(std::move(raw)), "PREWHERE");
  return *this;
}

SelectBuilder& SelectBuilder::Where(WhereRecord record) {
  AddWhere(Condition(std::move(record)));
  return *this;
}

SelectBuilder& SelectBuilder::Where(Combinator combinator) {
  AddWhere(Condition(std::move(combinator)));
  return *this;
}

SelectBuilder& SelectBuilder::Where(RawExpr raw) {
  AddWhere(Condition(std::move(raw)));
  return *this;
}

SelectBuilder& SelectBuilder::GroupBy(std::vector<std::string> columns) {
  node_.group_by.clear();
  for (const auto& column : columns) {
    node_.group_by.push_back(Col(column));
  }
  return *this;
}

SelectBuilder& SelectBuilder::Having(WhereRecord record) {
  node_.having = Lower(Condition(std::move(record)), "HAVING");
  return *this;
}

SelectBuilder& SelectBuilder::Having(Combinator combinator) {
  node_.having = Lower(Condition(std::move(combinator)), "HAVING");
  return *this;
}

SelectBuilder& SelectBuilder::Having(RawExpr raw) {
  node_.having = Lower(Condition(std::move(raw)), "HAVING");
  return *this;
}

SelectBuilder& SelectBuilder::OrderBy(std::vector<OrderItem> specs) {
  node_.order_by.clear();
  for (const auto& spec : specs) {
    node_.order_by.push_back(OrderSpec{.column = Col(spec.column), .direction = spec.direction});
  }
  return *this;
}

SelectBuilder& SelectBuilder::Limit(std::int64_t limit, std::optional<std::int64_t> offset) {
  node_.limit = limit;
  node_.offset = offset;
  return *this;
}

SelectBuilder& SelectBuilder::Final() {
  node_.final = true;
  return *this;
}

SelectBuilder& SelectBuilder::Settings(Map settings) {
  node_.settings = std::move(settings);
  return *this;
}

SelectBuilder& SelectBuilder::Format(std::string format) {
  node_.format = std::move(format);
  return *this;
}

SelectBuilder& SelectBuilder::Union(const SelectBuilder& query) {
  node_.set_operations.push_back(SetOperationSpec{.type = SetOperation::kUnion, .query = Subquery(query)});
  return *this;
}

SelectBuilder& SelectBuilder::UnionAll(const SelectBuilder& query) {
  node_.set_operations.push_back(SetOperationSpec{.type = SetOperation::kUnionAll, .query = Subquery(query)});
  return *this;
}

Subquery SelectBuilder::AsSubquery(std::optional<std::string> alias) const {
  Subquery subquery(*this);
  subquery.alias = std::move(alias);
  return subquery;
}

boost::asio::awaitable<Result<Rows>> SelectBuilder::Run(QueryRunner& runner) const {
  auto compiled = ToSql();
  if (!compiled) {
    co_return std::unexpected(std::move(compiled.error()));
  }
  QueryRequest request{
      .sql = std::move(compiled->sql),
      .settings = node_.settings,
      .format = node_.format,
  };
  co_return co_await runner.Execute(std::move(request));
}

boost::asio::awaitable<Result<std::unique_ptr<ResultStream>>> SelectBuilder::Stream(QueryRunner& runner) const {
  std::string format = node_.format.value_or(std::string{kDefaultStreamFormat});
  if (!IsStreamableFormat(format)) {
    log_.Error("unsupported stream format " + format);
    co_return MakeError<ErrorType::kValidation>("Unsupported stream format: " + format,
                                                {.field = "format", .value = format});
  }
  auto compiled = ToSql();
  if (!compiled) {
    co_return std::unexpected(std::move(compiled.error()));
  }
  QueryRequest request{
      .sql = std::move(compiled->sql),
      .settings = node_.settings,
      .format = std::move(format),
  };
  co_return co_await runner.Stream(std::move(request));
}

SelectBuilder Select(std::vector<SelectItem> columns, std::shared_ptr<Logger> logger) {
  return SelectBuilder(std::move(columns), std::move(logger));
}

}  // namespace chq
