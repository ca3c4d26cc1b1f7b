/**
 * @file field.cpp
 * @brief Field implementation
 */

#include "catalog/field.hpp"

#include <cctype>
#include <charconv>

namespace schemata {

namespace {

std::string to_upper(std::string_view s) {
    std::string upper(s);
    for (char& ch : upper) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return upper;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

/// "MAX" yields an absent length, digits a positive one
bool parse_length(std::string_view s, std::optional<int64_t>* length) {
    if (s == "MAX") {
        *length = std::nullopt;
        return true;
    }
    int64_t value = 0;
    auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || end != s.data() + s.size() || value <= 0) {
        return false;
    }
    *length = value;
    return true;
}

FieldType scalar_type(std::string_view name) {
    for (FieldType type : {FieldType::BOOL, FieldType::INT64, FieldType::FLOAT64,
                           FieldType::STRING, FieldType::BYTES,
                           FieldType::TIMESTAMP, FieldType::DATE}) {
        if (field_type_name(type) == name) {
            return type;
        }
    }
    return FieldType::INVALID;
}

}  // namespace

Status Field::parse(std::string_view spanner_type, bool nullable, Field* out) {
    if (out == nullptr) {
        return Status::InvalidArgument("Output pointer cannot be null");
    }

    const std::string upper = to_upper(trim(spanner_type));
    std::string_view rest = upper;
    bool array = false;

    if (rest.substr(0, 6) == "ARRAY<") {
        if (rest.back() != '>') {
            return Status::CatalogRead("Malformed array type: " + upper);
        }
        array = true;
        rest = trim(rest.substr(6, rest.size() - 7));
    }

    std::string_view name = rest;
    std::optional<int64_t> length;
    auto paren = rest.find('(');
    if (paren != std::string_view::npos) {
        if (rest.back() != ')') {
            return Status::CatalogRead("Malformed type length: " + upper);
        }
        name = trim(rest.substr(0, paren));
        if (!parse_length(trim(rest.substr(paren + 1, rest.size() - paren - 2)), &length)) {
            return Status::CatalogRead("Malformed type length: " + upper);
        }
    }

    FieldType type = scalar_type(name);
    if (type == FieldType::INVALID) {
        return Status::CatalogRead("Unrecognized column type: " + std::string(spanner_type));
    }
    if (paren != std::string_view::npos && !is_sized(type)) {
        return Status::CatalogRead("Type does not take a length: " + upper);
    }

    *out = Field(type, nullable, array, length);
    return Status::Ok();
}

bool Field::has_valid_length() const noexcept {
    if (!length_.has_value()) {
        return true;
    }
    return is_sized(type_) && *length_ > 0;
}

std::string Field::type_ddl() const {
    std::string scalar(field_type_name(type_));
    if (is_sized(type_)) {
        scalar += length_.has_value() ? "(" + std::to_string(*length_) + ")" : "(MAX)";
    }
    return array_ ? "ARRAY<" + scalar + ">" : scalar;
}

std::string Field::ddl() const {
    return nullable_ ? type_ddl() : type_ddl() + " NOT NULL";
}

}  // namespace schemata
