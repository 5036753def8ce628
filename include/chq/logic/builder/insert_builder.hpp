#pragma once

#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include <chq/logic/builder/query_builder.hpp>
#include <chq/logic/runner/query_runner.hpp>
#include <chq/models/builder/ast.hpp>
#include <chq/models/builder/value.hpp>

namespace chq {

enum class InsertStrategy {
  kValues,
  kObjects,
  kStream,
};

std::string ToString(InsertStrategy strategy);

// INSERT INTO. The last of Values / Row, Objects and FromStream decides how
// Run() ships the data.
class InsertBuilder : public QueryBuilder<InsertBuilder, InsertNode> {
public:
  explicit InsertBuilder(std::string table, std::shared_ptr<Logger> logger = nullptr);

  InsertBuilder& Columns(std::vector<std::string> columns);
  InsertBuilder& Values(std::vector<std::vector<Value>> rows);
  InsertBuilder& Row(std::vector<Value> row);
  InsertBuilder& Objects(Rows objects);
  InsertBuilder& FromStream(std::shared_ptr<std::istream> stream);
  InsertBuilder& Format(std::string format);

  InsertStrategy Strategy() const;

  // Values go through Command() as SQL text, objects and streams through the
  // runner's native Insert().
  boost::asio::awaitable<Result<>> Run(QueryRunner& runner) const;

private:
  Result<InsertRequest> MakeInsertRequest() const;

  InsertStrategy strategy_ = InsertStrategy::kValues;
  std::optional<Rows> objects_;
  std::shared_ptr<std::istream> stream_;
};

InsertBuilder InsertInto(std::string table, std::shared_ptr<Logger> logger = nullptr);

}  // namespace chq
