#include <chq/logic/builder/insert_builder.hpp>

#include <string>
#include <utility>

namespace chq {

namespace {

std::string JoinErrors(const std::vector<std::string>& errors) {
  std::string res;
  for (const auto& error : errors) {
    if (!res.empty()) {
      res += ", ";
    }
    res += error;
  }
  return res;
}

}  // namespace

std::string ToString(InsertStrategy strategy) {
  switch (strategy) {
    case InsertStrategy::kValues:
      return "values";
    case InsertStrategy::kObjects:
      return "objects";
    case InsertStrategy::kStream:
      return "stream";
  }
  std::unreachable();
}

InsertBuilder::InsertBuilder(std::string table, std::shared_ptr<Logger> logger)
    : QueryBuilder(InsertNode{.table = std::move(table)}, std::move(logger), "InsertBuilder") {}

InsertBuilder& InsertBuilder::Columns(std::vector<std::string> columns) {
  node_.columns = std::move(columns);
  return *this;
}

InsertBuilder& InsertBuilder::Values(std::vector<std::vector<Value>> rows) {
  strategy_ = InsertStrategy::kValues;
  node_.values = std::move(rows);
  return *this;
}

InsertBuilder& InsertBuilder::Row(std::vector<Value> row) {
  strategy_ = InsertStrategy::kValues;
  node_.values.push_back(std::move(row));
  return *this;
}

InsertBuilder& InsertBuilder::Objects(Rows objects) {
  strategy_ = InsertStrategy::kObjects;
  objects_ = std::move(objects);
  return *this;
}

InsertBuilder& InsertBuilder::FromStream(std::shared_ptr<std::istream> stream) {
  strategy_ = InsertStrategy::kStream;
  stream_ = std::move(stream);
  return *this;
}

InsertBuilder& InsertBuilder::Format(std::string format) {
  node_.format = std::move(format);
  return *this;
}

InsertStrategy InsertBuilder::Strategy() const { return strategy_; }

Result<InsertRequest> InsertBuilder::MakeInsertRequest() const {
  auto validation = Validate();
  if (!validation.valid) {
    return MakeError<ErrorType::kValidation>("Query validation failed: " + JoinErrors(validation.errors),
                                             {.field = "query"});
  }

  InsertRequest request{.table = node_.table, .columns = node_.columns};
  if (strategy_ == InsertStrategy::kObjects) {
    if (!objects_ || objects_->empty()) {
      return MakeError<ErrorType::kValidation>("Object data is required for object-based inserts",
                                               {.field = "data"});
    }
    request.values = *objects_;
    request.format = node_.format.value_or(std::string{kDefaultObjectsFormat});
  } else {
    if (!stream_) {
      return MakeError<ErrorType::kValidation>("Stream data is required for stream-based inserts",
                                               {.field = "data"});
    }
    request.values = stream_;
    request.format = node_.format.value_or(std::string{kDefaultInsertStreamFormat});
  }
  return request;
}

boost::asio::awaitable<Result<>> InsertBuilder::Run(QueryRunner& runner) const {
  log_.Debug("running insert into " + node_.table + " using " + ToString(strategy_));

  if (strategy_ == InsertStrategy::kValues) {
    if (node_.values.empty()) {
      co_return MakeError<ErrorType::kValidation>("Values are required for value-based inserts",
                                                  {.field = "values"});
    }
    auto compiled = ToSql();
    if (!compiled) {
      co_return std::unexpected(std::move(compiled.error()));
    }
    QueryRequest request{.sql = std::move(compiled->sql), .format = node_.format};
    co_return co_await runner.Command(std::move(request));
  }

  auto request = MakeInsertRequest();
  if (!request) {
    log_.Error(request.error().What());
    co_return std::unexpected(std::move(request.error()));
  }
  co_return co_await runner.Insert(std::move(*request));
}

InsertBuilder InsertInto(std::string table, std::shared_ptr<Logger> logger) {
  return InsertBuilder(std::move(table), std::move(logger));
}

}  // namespace chq
