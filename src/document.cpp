// SPDX-License-Identifier: MIT

#include "kvmigrate/document.hpp"

#include <cmath>
#include <limits>

#include <fmt/format.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace kvmigrate {

namespace {

void WriteValue(const Value& value, rapidjson::Writer<rapidjson::StringBuffer>& writer) {
    switch (value.kind()) {
        case Value::Kind::Null:
            writer.Null();
            break;
        case Value::Kind::Bool:
            writer.Bool(value.AsBool());
            break;
        case Value::Kind::Int:
            writer.Int64(value.AsInt());
            break;
        case Value::Kind::Uint:
            writer.Uint64(value.AsUint());
            break;
        case Value::Kind::Double:
            writer.Double(value.AsDouble());
            break;
        case Value::Kind::String: {
            const auto& s = value.AsString();
            writer.String(s.data(), static_cast<rapidjson::SizeType>(s.size()));
            break;
        }
        case Value::Kind::Array:
            writer.StartArray();
            for (const auto& element : value.AsArray()) {
                WriteValue(element, writer);
            }
            writer.EndArray();
            break;
        case Value::Kind::Object:
            writer.StartObject();
            for (const auto& [key, member] : value.AsObject()) {
                writer.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
                WriteValue(member, writer);
            }
            writer.EndObject();
            break;
    }
}

}  // namespace

double Value::ToDouble() const {
    switch (kind()) {
        case Kind::Int: return static_cast<double>(AsInt());
        case Kind::Uint: return static_cast<double>(AsUint());
        default: return AsDouble();
    }
}

const Value* Value::Find(std::string_view key) const {
    if (!IsObject()) return nullptr;
    for (const auto& [name, member] : AsObject()) {
        if (name == key) return &member;
    }
    return nullptr;
}

void Value::Set(std::string key, Value value) {
    auto& members = AsObject();
    for (auto& [name, member] : members) {
        if (name == key) {
            member = std::move(value);
            return;
        }
    }
    members.emplace_back(std::move(key), std::move(value));
}

std::string ToJson(const Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    WriteValue(value, writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::optional<std::string> IdentifierOf(const Value& value) {
    switch (value.kind()) {
        case Value::Kind::String:
            if (value.AsString().empty()) return std::nullopt;
            return value.AsString();
        case Value::Kind::Int:
            return fmt::format("{}", value.AsInt());
        case Value::Kind::Uint:
            return fmt::format("{}", value.AsUint());
        case Value::Kind::Double: {
            double d = value.AsDouble();
            // Integral doubles within int64 range ("id": 7.0) identify like integers
            if (std::isfinite(d) && std::trunc(d) == d &&
                std::abs(d) < static_cast<double>(std::numeric_limits<int64_t>::max())) {
                return fmt::format("{}", static_cast<int64_t>(d));
            }
            return std::nullopt;
        }
        default:
            return std::nullopt;
    }
}

}  // namespace kvmigrate
