// SPDX-License-Identifier: MIT

// include/kvmigrate/document.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace kvmigrate {

class Value;

using Array = std::vector<Value>;
/// Object members in source order. Lookups are linear; export documents are small.
using Object = std::vector<std::pair<std::string, Value>>;

/// Parsed JSON value from a source export document.
class Value {
public:
    enum class Kind { Null, Bool, Int, Uint, Double, String, Array, Object };

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : data_(b) {}
    Value(int v) : data_(static_cast<int64_t>(v)) {}
    Value(int64_t v) : data_(v) {}
    Value(uint64_t v) : data_(v) {}
    Value(double v) : data_(v) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(Array a) : data_(std::move(a)) {}
    Value(Object o) : data_(std::move(o)) {}

    Kind kind() const { return static_cast<Kind>(data_.index()); }

    bool IsNull() const { return kind() == Kind::Null; }
    bool IsBool() const { return kind() == Kind::Bool; }
    bool IsString() const { return kind() == Kind::String; }
    bool IsArray() const { return kind() == Kind::Array; }
    bool IsObject() const { return kind() == Kind::Object; }
    bool IsNumber() const {
        auto k = kind();
        return k == Kind::Int || k == Kind::Uint || k == Kind::Double;
    }

    bool AsBool() const { return std::get<bool>(data_); }
    int64_t AsInt() const { return std::get<int64_t>(data_); }
    uint64_t AsUint() const { return std::get<uint64_t>(data_); }
    double AsDouble() const { return std::get<double>(data_); }
    const std::string& AsString() const { return std::get<std::string>(data_); }
    const Array& AsArray() const { return std::get<Array>(data_); }
    Array& AsArray() { return std::get<Array>(data_); }
    const Object& AsObject() const { return std::get<Object>(data_); }
    Object& AsObject() { return std::get<Object>(data_); }

    /// Numeric value widened to double. Precondition: IsNumber().
    double ToDouble() const;

    /// Member lookup. Returns nullptr when this is not an object or the key is absent.
    const Value* Find(std::string_view key) const;

    /// Insert or replace an object member. Precondition: IsObject().
    void Set(std::string key, Value value);

    bool operator==(const Value& other) const = default;

private:
    std::variant<std::monostate, bool, int64_t, uint64_t, double, std::string, Array, Object> data_;
};

/// Serialize a value as compact JSON.
std::string ToJson(const Value& value);

/// Normalize a value to an original-identifier string.
///
/// Strings are used verbatim, integers in decimal, integral doubles as
/// integers. Null, booleans, non-integral numbers, arrays and objects are not
/// identifiers and yield std::nullopt.
std::optional<std::string> IdentifierOf(const Value& value);

}  // namespace kvmigrate
