#pragma once

#include <memory>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include <chq/logic/builder/query_builder.hpp>
#include <chq/logic/runner/query_runner.hpp>
#include <chq/models/builder/ast.hpp>
#include <chq/models/builder/operators.hpp>
#include <chq/models/builder/value.hpp>

namespace chq {

// ALTER TABLE ... UPDATE mutation.
class UpdateBuilder : public QueryBuilder<UpdateBuilder, UpdateNode> {
public:
  explicit UpdateBuilder(std::string table, std::shared_ptr<Logger> logger = nullptr);

  // Merged into earlier assignments, later values win.
  UpdateBuilder& Set(Map values);

  UpdateBuilder& Where(WhereRecord record);
  UpdateBuilder& Where(Combinator combinator);
  UpdateBuilder& Where(RawExpr raw);

  UpdateBuilder& Settings(Map settings);

  boost::asio::awaitable<Result<>> Run(QueryRunner& runner) const;
};

UpdateBuilder Update(std::string table, std::shared_ptr<Logger> logger = nullptr);

}  // namespace chq
