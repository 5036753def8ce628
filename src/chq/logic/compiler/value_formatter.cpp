#include <chq/logic/compiler/value_formatter.hpp>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace chq {

std::string FormatValue(const Value& value) {
  struct Formatter {
    std::string operator()(const NullValue&) { return "NULL"; }
    std::string operator()(bool v) { return v ? "true" : "false"; }
    std::string operator()(std::int64_t v) { return std::to_string(v); }
    std::string operator()(double v) { return FormatNumber(v); }
    std::string operator()(const std::string& v) { return FormatString(v); }
    std::string operator()(const DateTime& v) { return FormatDateTime(v); }
    std::string operator()(const Array& v) {
      std::string res = "[";
      for (std::size_t i = 0; i < v.size(); ++i) {
        if (i != 0) {
          res += ", ";
        }
        res += FormatValue(v[i]);
      }
      return res + "]";
    }
    std::string operator()(const Map& v) {
      std::string res = "{";
      for (std::size_t i = 0; i < v.size(); ++i) {
        if (i != 0) {
          res += ", ";
        }
        res += FormatString(v[i].key) + ": " + FormatValue(v[i].value);
      }
      return res + "}";
    }
  };
  return std::visit(Formatter{}, value.data);
}

std::string FormatString(std::string_view value) { return "'" + EscapeString(value) + "'"; }

std::string FormatNumber(double value) {
  if (std::isnan(value)) {
    return "NULL";
  }
  if (std::isinf(value)) {
    return value > 0 ? "'inf'" : "'-inf'";
  }
  char buf[64];
  auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
  if (ec != std::errc{}) {
    return std::to_string(value);
  }
  return std::string(buf, end);
}

std::string FormatDateTime(DateTime value) {
  auto seconds = std::chrono::floor<std::chrono::seconds>(value);
  auto days = std::chrono::floor<std::chrono::days>(seconds);
  std::chrono::year_month_day date{days};
  std::chrono::hh_mm_ss time{seconds - days};

  std::ostringstream s;
  s << '\'' << std::setfill('0') << std::setw(4) << static_cast<int>(date.year()) << '-'
    << std::setw(2) << static_cast<unsigned>(date.month()) << '-' << std::setw(2)
    << static_cast<unsigned>(date.day()) << ' ' << std::setw(2) << time.hours().count() << ':'
    << std::setw(2) << time.minutes().count() << ':' << std::setw(2) << time.seconds().count()
    << '\'';
  return s.str();
}

std::string EscapeString(std::string_view value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (char c : value) {
    if (c == '\'') {
      escaped.push_back('\'');
    }
    escaped.push_back(c);
  }
  return escaped;
}

Result<std::string> InjectValues(std::string_view sql, const std::vector<Value>& values) {
  if (values.empty()) {
    return std::string{sql};
  }
  auto placeholders = static_cast<std::size_t>(std::ranges::count(sql, '?'));
  if (placeholders != values.size()) {
    return MakeError<ErrorType::kValidation>(
        "Parameter count mismatch. SQL has " + std::to_string(placeholders)
            + " placeholders, but " + std::to_string(values.size()) + " values provided",
        {.field = "params", .value = std::to_string(values.size())});
  }

  std::string res;
  res.reserve(sql.size());
  std::size_t index = 0;
  for (char c : sql) {
    if (c == '?') {
      res += FormatValue(values[index++]);
      continue;
    }
    res.push_back(c);
  }
  return res;
}

}  // namespace chq
