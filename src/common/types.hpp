#pragma once

/**
 * @file types.hpp
 * @brief Common type definitions for Schemata
 */

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace schemata {

// ─────────────────────────────────────────────────────────────────────────────
// Basic Type Aliases
// ─────────────────────────────────────────────────────────────────────────────

/// Transaction identifier
using txn_id_t = uint64_t;

/// Schema version (monotonic, one per applied DDL batch)
using schema_version_t = uint64_t;

// ─────────────────────────────────────────────────────────────────────────────
// Invalid/Sentinel Values
// ─────────────────────────────────────────────────────────────────────────────

/// Invalid schema version
constexpr schema_version_t INVALID_SCHEMA_VERSION = 0;

// ─────────────────────────────────────────────────────────────────────────────
// Data Types
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Column types understood by the catalog
 */
enum class FieldType : uint8_t {
    INVALID = 0,
    BOOL,
    INT64,
    FLOAT64,
    STRING,     // Variable-length, rendered with a length
    BYTES,      // Variable-length, rendered with a length
    TIMESTAMP,
    DATE,
};

/**
 * @brief DDL name of a type, without length
 */
constexpr std::string_view field_type_name(FieldType type) noexcept {
    switch (type) {
        case FieldType::BOOL:      return "BOOL";
        case FieldType::INT64:     return "INT64";
        case FieldType::FLOAT64:   return "FLOAT64";
        case FieldType::STRING:    return "STRING";
        case FieldType::BYTES:     return "BYTES";
        case FieldType::TIMESTAMP: return "TIMESTAMP";
        case FieldType::DATE:      return "DATE";
        default:                   return "INVALID";
    }
}

/**
 * @brief Check if a type carries a length in DDL
 */
constexpr bool is_sized(FieldType type) noexcept {
    return type == FieldType::STRING || type == FieldType::BYTES;
}

}  // namespace schemata
