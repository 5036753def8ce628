#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <chq/logic/result/result.hpp>
#include <chq/models/builder/value.hpp>

namespace chq {

// ClickHouse literal for `value`: 'str' with doubled quotes, numbers as is,
// 'inf'/'-inf' for infinities, NULL for NaN, 'YYYY-MM-DD HH:MM:SS' (UTC) for
// date-times, [..] for arrays and {'k': v} for maps.
std::string FormatValue(const Value& value);

std::string FormatString(std::string_view value);

std::string FormatNumber(double value);

std::string FormatDateTime(DateTime value);

// Doubles single quotes, adds no surrounding quotes.
std::string EscapeString(std::string_view value);

// Replaces each '?' with the next formatted value. The sql is returned as is
// when `values` is empty.
Result<std::string> InjectValues(std::string_view sql, const std::vector<Value>& values);

}  // namespace chq
