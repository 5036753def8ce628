#include <benchmark/benchmark.h>

#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <chq/logic/builder/select_builder.hpp>
#include <chq/logic/runner/fake_runner.hpp>

namespace chq {

namespace {

std::shared_ptr<Logger> Quiet() { return std::make_shared<NullLogger>(); }

SelectBuilder SimpleSelect(std::int64_t) { return Select({"id"}, Quiet()).From("users").Where({{"id", Eq(1)}}); }

SelectBuilder JoinSelect(std::int64_t) {
  return Select({"u.id", "u.name", As(fn::Count("o.id"), "orders")}, Quiet())
      .From("users", "u")
      .LeftJoin("orders", {"u.id", EqCol("o.user_id")}, "o")
      .Where({{"u.active", Eq(true)}, {"u.age", Between(18, 65)}})
      .GroupBy({"u.id", "u.name"})
      .Having({{"orders", Gt(5)}})
      .OrderBy({{"orders", Direction::kDesc}})
      .Limit(10);
}

SelectBuilder LargeInList(std::int64_t size) {
  Array ids;
  ids.reserve(size);
  for (std::int64_t i = 0; i < size; ++i) {
    ids.emplace_back(i);
  }
  return Select({"id"}, Quiet()).From("events").Where({{"user_id", In(std::move(ids))}});
}

SelectBuilder NestedSubqueries(std::int64_t depth) {
  auto query = Select({"id"}, Quiet()).From("t0");
  for (std::int64_t i = 1; i <= depth; ++i) {
    query = Select({"id"}, Quiet()).From("t" + std::to_string(i)).Where({{"id", In(Subquery(query))}});
  }
  return query;
}

}  // namespace

template <SelectBuilder (*Make)(std::int64_t)>
void BM_ToSql(benchmark::State& state) {
  auto builder = Make(state.range(0));

  for (auto _ : state) {
    benchmark::DoNotOptimize(builder.ToSql());
  }
}

template <SelectBuilder (*Make)(std::int64_t)>
void BM_Run(benchmark::State& state) {
  auto builder = Make(state.range(0));
  FakeRunner runner;
  boost::asio::io_context ctx;
  boost::asio::co_spawn(
      ctx,
      [&state, &builder, &runner]() -> boost::asio::awaitable<void> {
        for (auto _ : state) {
          benchmark::DoNotOptimize(co_await builder.Run(runner));
          runner.calls.clear();
          runner.requests.clear();
        }
      }(),
      [](std::exception_ptr p) {
        if (p) std::rethrow_exception(p);
      });

  ctx.run();
}

BENCHMARK(BM_ToSql<SimpleSelect>)->Arg(0);
BENCHMARK(BM_ToSql<JoinSelect>)->Arg(0);
BENCHMARK(BM_ToSql<LargeInList>)->RangeMultiplier(4)->Range(16, 16384);
BENCHMARK(BM_ToSql<NestedSubqueries>)->DenseRange(1, 9, 4);

BENCHMARK(BM_Run<SimpleSelect>)->Arg(0)->UseRealTime();
BENCHMARK(BM_Run<JoinSelect>)->Arg(0)->UseRealTime();

}  // namespace chq

BENCHMARK_MAIN();
