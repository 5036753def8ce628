#pragma once

#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace chq {

struct NullValue {
    auto operator<=>(const NullValue& other) const = default;
};

using DateTime = std::chrono::system_clock::time_point;

struct Value;
struct MapEntry;

using Array = std::vector<Value>;
// Ordered key/value list, insertion order is kept.
using Map = std::vector<MapEntry>;

struct Value {
    using Storage = std::variant<NullValue, bool, std::int64_t, double, std::string, DateTime, Array, Map>;

    Value();
    Value(std::nullptr_t);
    Value(bool v);
    template <std::integral T>
        requires(!std::same_as<T, bool>)
    Value(T v) : data(static_cast<std::int64_t>(v)) {}
    Value(float v);
    Value(double v);
    Value(const char* v);
    Value(std::string v);
    Value(std::string_view v);
    Value(DateTime v);
    Value(Array v);
    Value(Map v);

    bool IsNull() const;

    bool operator==(const Value& other) const;

    Storage data;
};

struct MapEntry {
    std::string key;
    Value value;

    bool operator==(const MapEntry& other) const;
};

using Row = std::vector<Value>;
using Rows = std::vector<Map>;
using Settings = Map;

// Later keys overwrite earlier ones in place, new keys are appended.
void MergeInto(Map& target, const Map& source);

std::string ToString(const Value& value);

}  // namespace chq
