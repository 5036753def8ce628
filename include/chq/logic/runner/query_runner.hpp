#pragma once

#include <istream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include <chq/logic/result/result.hpp>
#include <chq/models/builder/value.hpp>

namespace chq {

inline constexpr std::string_view kDefaultStreamFormat = "JSONEachRow";
inline constexpr std::string_view kDefaultObjectsFormat = "JSONEachRow";
inline constexpr std::string_view kDefaultInsertStreamFormat = "JSONCompactEachRow";

std::span<const std::string_view> StreamableFormats();

bool IsStreamableFormat(std::string_view format);

struct QueryRequest {
    std::string sql;
    Settings settings;
    std::optional<std::string> format;
};

using InsertValues = std::variant<Rows, std::shared_ptr<std::istream>>;

// Native insert, bypasses SQL text.
struct InsertRequest {
    std::string table;
    InsertValues values;
    std::string format;
    std::vector<std::string> columns;
};

// Chunks of a streamed result in the requested format. An empty optional
// marks the end of the stream.
class ResultStream {
public:
  virtual ~ResultStream() = default;
  virtual boost::asio::awaitable<Result<std::optional<std::string>>> ReadChunk() = 0;
};

// Transport to a ClickHouse server. Implementations own connections, retries
// and timeouts, reporting failures as kQuery, kConnection, kTimeout or
// kCancelled errors.
class QueryRunner {
public:
  virtual ~QueryRunner() = default;

  virtual boost::asio::awaitable<Result<Rows>> Execute(QueryRequest request) = 0;
  virtual boost::asio::awaitable<Result<>> Command(QueryRequest request) = 0;
  virtual boost::asio::awaitable<Result<std::unique_ptr<ResultStream>>> Stream(QueryRequest request) = 0;
  virtual boost::asio::awaitable<Result<>> Insert(InsertRequest request) = 0;
};

}  // namespace chq
