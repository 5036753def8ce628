#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <chq/logic/runner/query_runner.hpp>

namespace chq {

// In-memory ResultStream handing out prepared chunks.
class ChunkStream final : public ResultStream {
public:
  explicit ChunkStream(std::vector<std::string> chunks) : chunks_(std::move(chunks)) {}

  boost::asio::awaitable<Result<std::optional<std::string>>> ReadChunk() override {
    if (next_ == chunks_.size()) {
      co_return std::optional<std::string>{};
    }
    co_return std::optional<std::string>{chunks_[next_++]};
  }

private:
  std::vector<std::string> chunks_;
  std::size_t next_ = 0;
};

// Records every request, answers with canned rows and chunks.
class FakeRunner final : public QueryRunner {
public:
  boost::asio::awaitable<Result<Rows>> Execute(QueryRequest request) override {
    calls.push_back("execute");
    requests.push_back(std::move(request));
    co_return rows;
  }

  boost::asio::awaitable<Result<>> Command(QueryRequest request) override {
    calls.push_back("command");
    requests.push_back(std::move(request));
    if (command_error) {
      co_return std::unexpected(*command_error);
    }
    co_return Ok();
  }

  boost::asio::awaitable<Result<std::unique_ptr<ResultStream>>> Stream(QueryRequest request) override {
    calls.push_back("stream");
    requests.push_back(std::move(request));
    co_return std::make_unique<ChunkStream>(chunks);
  }

  boost::asio::awaitable<Result<>> Insert(InsertRequest request) override {
    calls.push_back("insert");
    inserts.push_back(std::move(request));
    co_return Ok();
  }

  std::vector<std::string> calls;
  std::vector<QueryRequest> requests;
  std::vector<InsertRequest> inserts;
  Rows rows;
  std::vector<std::string> chunks;
  std::optional<Error> command_error;
};

// Drives `task` to completion on a private io_context.
template <typename T>
T RunSync(boost::asio::awaitable<T> task) {
  boost::asio::io_context ctx;
  std::optional<T> got;
  boost::asio::co_spawn(ctx, std::move(task), [&got](std::exception_ptr p, T result) {
    if (p) std::rethrow_exception(p);
    got.emplace(std::move(result));
  });
  ctx.run();
  return std::move(*got);
}

}  // namespace chq
