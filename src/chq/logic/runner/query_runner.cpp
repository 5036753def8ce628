#include <chq/logic/runner/query_runner.hpp>

#include <algorithm>
#include <array>

namespace chq {

namespace {

constexpr std::array<std::string_view, 14> kStreamableFormats = {
    "JSONEachRow",
    "JSONStringsEachRow",
    "JSONCompactEachRow",
    "JSONCompactEachRowWithNames",
    "JSONCompactEachRowWithNamesAndTypes",
    "CSV",
    "CSVWithNames",
    "CSVWithNamesAndTypes",
    "TabSeparated",
    "TabSeparatedRaw",
    "TabSeparatedWithNames",
    "TabSeparatedWithNamesAndTypes",
    "TabSeparatedRawWithNames",
    "TabSeparatedRawWithNamesAndTypes",
};

}  // namespace

std::span<const std::string_view> StreamableFormats() { return kStreamableFormats; }

bool IsStreamableFormat(std::string_view format) {
  return std::ranges::find(kStreamableFormats, format) != kStreamableFormats.end();
}

}  // namespace chq
