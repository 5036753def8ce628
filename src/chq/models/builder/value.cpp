#include <chq/models/builder/value.hpp>

#include <algorithm>
#include <sstream>

namespace chq {

Value::Value() : data(NullValue{}) {}

Value::Value(std::nullptr_t) : data(NullValue{}) {}

Value::Value(bool v) : data(v) {}

Value::Value(float v) : data(static_cast<double>(v)) {}

Value::Value(double v) : data(v) {}

Value::Value(const char* v) : data(std::string{v}) {}

Value::Value(std::string v) : data(std::move(v)) {}

Value::Value(std::string_view v) : data(std::string{v}) {}

Value::Value(DateTime v) : data(v) {}

Value::Value(Array v) : data(std::move(v)) {}

Value::Value(Map v) : data(std::move(v)) {}

bool Value::IsNull() const { return std::holds_alternative<NullValue>(data); }

bool Value::operator==(const Value& other) const { return data == other.data; }

bool MapEntry::operator==(const MapEntry& other) const {
  return key == other.key && value == other.value;
}

void MergeInto(Map& target, const Map& source) {
  for (const auto& entry : source) {
    auto it = std::ranges::find(target, entry.key, &MapEntry::key);
    if (it != target.end()) {
      it->value = entry.value;
      continue;
    }
    target.push_back(entry);
  }
}

std::string ToString(const Value& value) {
  struct DebugFormatter {
    void operator()(const NullValue&) { s << "null"; }
    void operator()(bool v) { s << (v ? "true" : "false"); }
    void operator()(std::int64_t v) { s << v; }
    void operator()(double v) { s << v; }
    void operator()(const std::string& v) { s << '"' << v << '"'; }
    void operator()(const DateTime& v) {
      s << std::chrono::duration_cast<std::chrono::seconds>(v.time_since_epoch()).count() << 's';
    }
    void operator()(const Array& v) {
      s << '[';
      for (std::size_t i = 0; i < v.size(); ++i) {
        if (i != 0) {
          s << ", ";
        }
        std::visit(*this, v[i].data);
      }
      s << ']';
    }
    void operator()(const Map& v) {
      s << '{';
      for (std::size_t i = 0; i < v.size(); ++i) {
        if (i != 0) {
          s << ", ";
        }
        s << v[i].key << ": ";
        std::visit(*this, v[i].value.data);
      }
      s << '}';
    }

    std::ostringstream& s;
  };

  std::ostringstream s;
  std::visit(DebugFormatter{s}, value.data);
  return s.str();
}

}  // namespace chq
