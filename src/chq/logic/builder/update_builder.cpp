#include <chq/logic/builder/update_builder.hpp>

#include <utility>

namespace chq {

UpdateBuilder::UpdateBuilder(std::string table, std::shared_ptr<Logger> logger)
    : QueryBuilder(UpdateNode{.table = std::move(table)}, std::move(logger), "UpdateBuilder") {}

UpdateBuilder& UpdateBuilder::Set(Map values) {
  MergeInto(node_.set, values);
  return *this;
}

UpdateBuilder& UpdateBuilder::Where(WhereRecord record) {
  AddWhere(Condition(std::move(record)));
  return *this;
}

UpdateBuilder& UpdateBuilder::Where(Combinator combinator) {
  AddWhere(Condition(std::move(combinator)));
  return *this;
}

UpdateBuilder& UpdateBuilder::Where(RawExpr raw) {
  AddWhere(Condition(std::move(raw)));
  return *this;
}

UpdateBuilder& UpdateBuilder::Settings(Map settings) {
  node_.settings = std::move(settings);
  return *this;
}

boost::asio::awaitable<Result<>> UpdateBuilder::Run(QueryRunner& runner) const {
  auto compiled = ToSql();
  if (!compiled) {
    co_return std::unexpected(std::move(compiled.error()));
  }
  QueryRequest request{.sql = std::move(compiled->sql), .settings = node_.settings};
  co_return co_await runner.Command(std::move(request));
}

UpdateBuilder Update(std::string table, std::shared_ptr<Logger> logger) {
  return UpdateBuilder(std::move(table), std::move(logger));
}

}  // namespace chq
