// SPDX-License-Identifier: MIT

// include/kvmigrate/error.hpp
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace kvmigrate {

/// Error codes for every planning, document and record failure.
enum class ErrorCode {
    // Plan (fatal, surface before any output is written)
    SchemaUnavailable,     ///< Destination database cannot be opened or its catalog read
    ExportUnavailable,     ///< Export root missing or not a directory
    CyclicDependency,      ///< Foreign keys form a cycle across distinct tables
    OutputUnavailable,     ///< Output artifact cannot be written

    // Config
    InvalidConfig,         ///< Config file or command line is malformed

    // Document (recovered, file skipped)
    InvalidDocumentFormat, ///< File unreadable, not JSON, or not an object/array of objects

    // Catalog (recovered, directory excluded)
    UnknownTable,          ///< Resolved table name not present in the destination schema

    // Record (recovered, record skipped)
    MissingParent,         ///< Foreign key references an original id with no surrogate key
    MissingIdentifier,     ///< Record lacks its own primary-key identifier
    DuplicateIdentifier,   ///< Record repeats an identifier already migrated for its table
};

/// Error payload returned through std::expected.
struct Error {
    ErrorCode code;                     ///< Classified error code
    std::string message;                ///< Human-readable description
    std::vector<std::string> involved;  ///< Tables, files or directories the error names
};

/// Return a short category string for an error code (e.g. "plan", "record").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::SchemaUnavailable:
        case ErrorCode::ExportUnavailable:
        case ErrorCode::CyclicDependency:
        case ErrorCode::OutputUnavailable:
            return "plan";
        case ErrorCode::InvalidConfig:
            return "config";
        case ErrorCode::InvalidDocumentFormat:
            return "document";
        case ErrorCode::UnknownTable:
            return "catalog";
        case ErrorCode::MissingParent:
        case ErrorCode::MissingIdentifier:
        case ErrorCode::DuplicateIdentifier:
            return "record";
    }
    return "unknown";
}

/// Return the taxonomy name of an error code (e.g. "MissingParent").
constexpr std::string_view error_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SchemaUnavailable: return "SchemaUnavailable";
        case ErrorCode::ExportUnavailable: return "ExportUnavailable";
        case ErrorCode::CyclicDependency: return "CyclicDependency";
        case ErrorCode::OutputUnavailable: return "OutputUnavailable";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::InvalidDocumentFormat: return "InvalidDocumentFormat";
        case ErrorCode::UnknownTable: return "UnknownTable";
        case ErrorCode::MissingParent: return "MissingParent";
        case ErrorCode::MissingIdentifier: return "MissingIdentifier";
        case ErrorCode::DuplicateIdentifier: return "DuplicateIdentifier";
    }
    return "Unknown";
}

/// True for errors that abort the run instead of skipping one file or record.
constexpr bool is_fatal(ErrorCode code) {
    auto category = error_category(code);
    return category == "plan" || category == "config";
}

}  // namespace kvmigrate
