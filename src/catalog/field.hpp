#pragma once

/**
 * @file field.hpp
 * @brief Column type as recorded by the catalog
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "common/status.hpp"
#include "common/types.hpp"

namespace schemata {

/**
 * @brief Type of one column: scalar type, length, nullability and array-ness
 *
 * STRING and BYTES carry a length; an absent length means MAX.
 */
class Field {
public:
    Field() = default;
    explicit Field(FieldType type, bool nullable = true, bool array = false,
                   std::optional<int64_t> length = std::nullopt)
        : type_(type), nullable_(nullable), array_(array), length_(length) {}

    /**
     * @brief Parse a catalog SPANNER_TYPE string
     *
     * Accepts "INT64", "STRING(MAX)", "BYTES(256)", "ARRAY<STRING(MAX)>", ...
     * A numeric length is retained; MAX is stored as an absent length.
     */
    [[nodiscard]] static Status parse(std::string_view spanner_type, bool nullable,
                                      Field* out);

    [[nodiscard]] FieldType type() const noexcept { return type_; }
    [[nodiscard]] bool nullable() const noexcept { return nullable_; }
    [[nodiscard]] bool is_array() const noexcept { return array_; }
    [[nodiscard]] const std::optional<int64_t>& length() const noexcept { return length_; }

    /// False for a length on an unsized type or a non-positive length
    [[nodiscard]] bool has_valid_length() const noexcept;

    /// Type part of a column definition, e.g. "ARRAY<STRING(MAX)>", "BYTES(256)"
    [[nodiscard]] std::string type_ddl() const;

    /// Full column definition suffix, e.g. "STRING(MAX) NOT NULL"
    [[nodiscard]] std::string ddl() const;

    bool operator==(const Field& other) const noexcept {
        return type_ == other.type_ && nullable_ == other.nullable_ &&
               array_ == other.array_ && length_ == other.length_;
    }
    bool operator!=(const Field& other) const noexcept { return !(*this == other); }

private:
    FieldType type_ = FieldType::INVALID;
    bool nullable_ = true;
    bool array_ = false;
    std::optional<int64_t> length_;
};

}  // namespace schemata
