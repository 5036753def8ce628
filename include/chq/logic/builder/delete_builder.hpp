#pragma once

#include <memory>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include <chq/logic/builder/query_builder.hpp>
#include <chq/logic/runner/query_runner.hpp>
#include <chq/models/builder/ast.hpp>
#include <chq/models/builder/operators.hpp>

namespace chq {

class DeleteBuilder : public QueryBuilder<DeleteBuilder, DeleteNode> {
public:
  explicit DeleteBuilder(std::string table, std::shared_ptr<Logger> logger = nullptr);

  DeleteBuilder& Where(WhereRecord record);
  DeleteBuilder& Where(Combinator combinator);
  DeleteBuilder& Where(RawExpr raw);

  DeleteBuilder& Settings(Map settings);

  boost::asio::awaitable<Result<>> Run(QueryRunner& runner) const;
};

DeleteBuilder DeleteFrom(std::string table, std::shared_ptr<Logger> logger = nullptr);

}  // namespace chq
