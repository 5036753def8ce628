#include <chq/logic/builder/delete_builder.hpp>

#include <utility>

namespace chq {

DeleteBuilder::DeleteBuilder(std::string table, std::shared_ptr<Logger> logger)
    : QueryBuilder(DeleteNode{.table = std::move(table)}, std::move(logger), "DeleteBuilder") {}

DeleteBuilder& DeleteBuilder::Where(WhereRecord record) {
  AddWhere(Condition(std::move(record)));
  return *this;
}

DeleteBuilder& DeleteBuilder::Where(Combinator combinator) {
  AddWhere(Condition(std::move(combinator)));
  return *this;
}

DeleteBuilder& DeleteBuilder::Where(RawExpr raw) {
  AddWhere(Condition(std::move(raw)));
  return *this;
}

DeleteBuilder& DeleteBuilder::Settings(Map settings) {
  node_.settings = std::move(settings);
  return *this;
}

boost::asio::awaitable<Result<>> DeleteBuilder::Run(QueryRunner& runner) const {
  auto compiled = ToSql();
  if (!compiled) {
    co_return std::unexpected(std::move(compiled.error()));
  }
  QueryRequest request{.sql = std::move(compiled->sql), .settings = node_.settings};
  co_return co_await runner.Command(std::move(request));
}

DeleteBuilder DeleteFrom(std::string table, std::shared_ptr<Logger> logger) {
  return DeleteBuilder(std::move(table), std::move(logger));
}

}  // namespace chq
