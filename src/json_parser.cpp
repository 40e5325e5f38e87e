// SPDX-License-Identifier: MIT

#include "kvmigrate/json_parser.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace kvmigrate {

void DocumentBuilder::Add(Value value) {
    if (stack_.empty()) {
        root_ = std::move(value);
        has_root_ = true;
        return;
    }
    auto& parent = stack_.back().container;
    if (parent.IsObject()) {
        parent.Set(std::move(pending_key_), std::move(value));
        pending_key_.clear();
    } else {
        parent.AsArray().push_back(std::move(value));
    }
}

void DocumentBuilder::Open(Value container) {
    stack_.push_back(Frame{std::move(container), std::move(pending_key_)});
    pending_key_.clear();
}

void DocumentBuilder::Close() {
    Frame frame = std::move(stack_.back());
    stack_.pop_back();
    pending_key_ = std::move(frame.key);
    Add(std::move(frame.container));
}

std::expected<Value, std::string> DocumentBuilder::Build() {
    if (!has_root_ || !stack_.empty()) {
        return std::unexpected("incomplete JSON document");
    }
    has_root_ = false;
    return std::move(root_);
}

std::expected<Value, Error> ParseDocument(const std::string& text) {
    DocumentBuilder builder;
    return ParseJson(builder, text);
}

std::expected<Value, Error> ReadDocumentFile(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (!ec && size > kMaxDocumentSize) {
        return std::unexpected(Error{
            ErrorCode::InvalidDocumentFormat,
            path.string() + ": document exceeds " +
                std::to_string(kMaxDocumentSize / (1024 * 1024)) + "MB",
            {path.string()}});
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(Error{ErrorCode::InvalidDocumentFormat,
                                     "cannot open " + path.string(),
                                     {path.string()}});
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        return std::unexpected(Error{ErrorCode::InvalidDocumentFormat,
                                     "cannot read " + path.string(),
                                     {path.string()}});
    }

    auto parsed = ParseDocument(contents.str());
    if (!parsed) {
        auto error = parsed.error();
        error.message = path.string() + ": " + error.message;
        error.involved.push_back(path.string());
        return std::unexpected(std::move(error));
    }
    return parsed;
}

}  // namespace kvmigrate
