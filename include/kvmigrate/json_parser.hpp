// SPDX-License-Identifier: MIT

// include/kvmigrate/json_parser.hpp
#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <rapidjson/error/en.h>
#include <rapidjson/reader.h>

#include "kvmigrate/document.hpp"
#include "kvmigrate/error.hpp"

namespace kvmigrate {

/// Deepest object/array nesting accepted in a document.
constexpr std::size_t kMaxJsonDepth = 256;

// Builder concept - types that can incrementally build a result from JSON events
template <typename B>
concept JsonBuilder = requires(B& b, std::string_view sv, int64_t i, uint64_t u,
                               double d, bool bl) {
    typename B::Result;
    { b.OnKey(sv) } -> std::same_as<void>;
    { b.OnString(sv) } -> std::same_as<void>;
    { b.OnInt(i) } -> std::same_as<void>;
    { b.OnUint(u) } -> std::same_as<void>;
    { b.OnDouble(d) } -> std::same_as<void>;
    { b.OnBool(bl) } -> std::same_as<void>;
    { b.OnNull() } -> std::same_as<void>;
    { b.OnStartObject() } -> std::same_as<void>;
    { b.OnEndObject() } -> std::same_as<void>;
    { b.OnStartArray() } -> std::same_as<void>;
    { b.OnEndArray() } -> std::same_as<void>;
    { b.Build() } -> std::same_as<std::expected<typename B::Result, std::string>>;
};

namespace detail {

// RapidJSON SAX handler that forwards to Builder. Stops the parse once
// nesting exceeds kMaxJsonDepth.
template <JsonBuilder Builder>
struct SaxHandler : public rapidjson::BaseReaderHandler<rapidjson::UTF8<>, SaxHandler<Builder>> {
    Builder& builder;
    std::size_t depth = 0;
    bool too_deep = false;

    explicit SaxHandler(Builder& b) : builder(b) {}

    bool Enter() {
        if (++depth > kMaxJsonDepth) {
            too_deep = true;
            return false;
        }
        return true;
    }

    bool Null() {
        builder.OnNull();
        return true;
    }
    bool Bool(bool b) {
        builder.OnBool(b);
        return true;
    }
    bool Int(int i) {
        builder.OnInt(static_cast<int64_t>(i));
        return true;
    }
    bool Uint(unsigned u) {
        builder.OnInt(static_cast<int64_t>(u));
        return true;
    }
    bool Int64(int64_t i) {
        builder.OnInt(i);
        return true;
    }
    bool Uint64(uint64_t u) {
        builder.OnUint(u);
        return true;
    }
    bool Double(double d) {
        builder.OnDouble(d);
        return true;
    }
    bool String(const char* str, rapidjson::SizeType length, bool /*copy*/) {
        builder.OnString(std::string_view(str, length));
        return true;
    }
    bool Key(const char* str, rapidjson::SizeType length, bool /*copy*/) {
        builder.OnKey(std::string_view(str, length));
        return true;
    }
    bool StartObject() {
        if (!Enter()) return false;
        builder.OnStartObject();
        return true;
    }
    bool EndObject(rapidjson::SizeType /*memberCount*/) {
        --depth;
        builder.OnEndObject();
        return true;
    }
    bool StartArray() {
        if (!Enter()) return false;
        builder.OnStartArray();
        return true;
    }
    bool EndArray(rapidjson::SizeType /*elementCount*/) {
        --depth;
        builder.OnEndArray();
        return true;
    }
};

}  // namespace detail

/// Parse a complete JSON text, feeding SAX events to @p builder.
///
/// Export files are read whole, so unlike a streaming parser this runs in one
/// call. Full-precision number parsing is used so identifiers and amounts
/// survive unchanged. The reader is iterative and rejects invalid UTF-8 and
/// nesting deeper than kMaxJsonDepth.
/// @param builder  Receives the events; its Build() produces the result.
/// @param text     Complete JSON text.
/// @return The built result, or an InvalidDocumentFormat error.
template <JsonBuilder Builder>
std::expected<typename Builder::Result, Error> ParseJson(Builder& builder,
                                                         const std::string& text) {
    detail::SaxHandler<Builder> handler(builder);
    rapidjson::Reader reader;
    // std::string::c_str() guarantees the terminator rapidjson::StringStream needs
    rapidjson::StringStream stream(text.c_str());

    constexpr unsigned kFlags = rapidjson::kParseIterativeFlag |
                                rapidjson::kParseValidateEncodingFlag |
                                rapidjson::kParseFullPrecisionFlag;
    auto result = reader.Parse<kFlags>(stream, handler);
    if (handler.too_deep) {
        return std::unexpected(Error{
            ErrorCode::InvalidDocumentFormat,
            "Parse error at offset " + std::to_string(result.Offset()) +
                ": nesting deeper than " + std::to_string(kMaxJsonDepth) + " levels"});
    }
    if (result.IsError()) {
        return std::unexpected(Error{
            ErrorCode::InvalidDocumentFormat,
            std::string("Parse error at offset ") + std::to_string(result.Offset()) +
                ": " + rapidjson::GetParseError_En(result.Code())});
    }

    auto built = builder.Build();
    if (!built) {
        return std::unexpected(Error{ErrorCode::InvalidDocumentFormat, built.error()});
    }
    return std::move(*built);
}

/// Builder producing a Value tree.
class DocumentBuilder {
public:
    using Result = Value;

    void OnKey(std::string_view key) { pending_key_ = std::string(key); }
    void OnString(std::string_view s) { Add(Value(std::string(s))); }
    void OnInt(int64_t i) { Add(Value(i)); }
    void OnUint(uint64_t u) { Add(Value(u)); }
    void OnDouble(double d) { Add(Value(d)); }
    void OnBool(bool b) { Add(Value(b)); }
    void OnNull() { Add(Value()); }

    void OnStartObject() { Open(Value(Object{})); }
    void OnEndObject() { Close(); }
    void OnStartArray() { Open(Value(Array{})); }
    void OnEndArray() { Close(); }

    std::expected<Result, std::string> Build();

private:
    struct Frame {
        Value container;
        std::string key;  // Key this container is stored under in its parent object
    };

    void Add(Value value);
    void Open(Value container);
    void Close();

    std::vector<Frame> stack_;
    std::string pending_key_;
    Value root_;
    bool has_root_ = false;
};

/// Parse JSON text into a Value.
std::expected<Value, Error> ParseDocument(const std::string& text);

/// Largest document file ReadDocumentFile() accepts.
constexpr std::uintmax_t kMaxDocumentSize = 64 * 1024 * 1024;  // 64MB

/// Read and parse a JSON file.
/// @return The parsed value, or InvalidDocumentFormat naming the file.
std::expected<Value, Error> ReadDocumentFile(const std::filesystem::path& path);

}  // namespace kvmigrate
