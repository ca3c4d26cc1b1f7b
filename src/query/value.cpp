/**
 * @file value.cpp
 * @brief Value implementation
 */

#include "query/value.hpp"

namespace schemata {

Value Value::from_optional(const std::optional<int64_t>& v) {
    return v.has_value() ? Value(*v) : Value();
}

Value Value::from_optional(const std::optional<std::string>& v) {
    return v.has_value() ? Value(*v) : Value();
}

std::optional<bool> Value::try_bool() const noexcept {
    if (auto* v = std::get_if<bool>(&value_)) return *v;
    return std::nullopt;
}

std::optional<int64_t> Value::try_int64() const noexcept {
    if (auto* v = std::get_if<int64_t>(&value_)) return *v;
    return std::nullopt;
}

std::optional<std::string_view> Value::try_string() const noexcept {
    if (auto* v = std::get_if<std::string>(&value_)) return *v;
    return std::nullopt;
}

int Value::compare(const Value& other) const noexcept {
    if (value_.index() != other.value_.index()) {
        return value_.index() < other.value_.index() ? -1 : 1;
    }

    if (auto* a = std::get_if<bool>(&value_)) {
        bool b = std::get<bool>(other.value_);
        return *a == b ? 0 : (*a ? 1 : -1);
    }
    if (auto* a = std::get_if<int64_t>(&value_)) {
        int64_t b = std::get<int64_t>(other.value_);
        return *a == b ? 0 : (*a < b ? -1 : 1);
    }
    if (auto* a = std::get_if<std::string>(&value_)) {
        int c = a->compare(std::get<std::string>(other.value_));
        return c == 0 ? 0 : (c < 0 ? -1 : 1);
    }
    return 0;  // both NULL
}

std::string Value::to_string() const {
    if (is_null()) return "NULL";
    if (auto* v = std::get_if<bool>(&value_)) return *v ? "TRUE" : "FALSE";
    if (auto* v = std::get_if<int64_t>(&value_)) return std::to_string(*v);
    if (auto* v = std::get_if<std::string>(&value_)) {
        std::string quoted = "'";
        for (char c : *v) {
            if (c == '\'') quoted += '\'';
            quoted += c;
        }
        return quoted + "'";
    }
    return "UNKNOWN";
}

}  // namespace schemata
