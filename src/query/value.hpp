#pragma once

/**
 * @file value.hpp
 * @brief Values held by catalog rows and compared by conditions
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace schemata {

/**
 * @brief A single catalog cell: NULL, BOOL, INT64 or STRING
 */
class Value {
public:
    using ValueType = std::variant<
        std::monostate,  // NULL
        bool,
        int64_t,
        std::string
    >;

    /// Construct a NULL value
    Value() : value_(std::monostate{}) {}

    /// Construct from various types
    explicit Value(bool v) : value_(v) {}
    explicit Value(int64_t v) : value_(v) {}
    explicit Value(int v) : value_(static_cast<int64_t>(v)) {}
    explicit Value(std::string v) : value_(std::move(v)) {}
    explicit Value(const char* v) : value_(std::string(v)) {}

    /// NULL when the optional is empty
    static Value from_optional(const std::optional<int64_t>& v);
    static Value from_optional(const std::optional<std::string>& v);

    /// Check if the value is NULL
    [[nodiscard]] bool is_null() const noexcept {
        return std::holds_alternative<std::monostate>(value_);
    }

    /// Type checking methods
    [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(value_); }
    [[nodiscard]] bool is_int64() const noexcept { return std::holds_alternative<int64_t>(value_); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(value_); }

    /// Safe value retrieval (returns nullopt if wrong type or NULL)
    [[nodiscard]] std::optional<bool> try_bool() const noexcept;
    [[nodiscard]] std::optional<int64_t> try_int64() const noexcept;
    [[nodiscard]] std::optional<std::string_view> try_string() const noexcept;

    /**
     * @brief Three-way comparison
     *
     * NULL sorts before every other value. Values of different kinds are
     * ordered by kind (BOOL < INT64 < STRING).
     * @return negative, zero or positive
     */
    [[nodiscard]] int compare(const Value& other) const noexcept;

    /// Convert to string representation (SQL literal form)
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Value& other) const noexcept { return value_ == other.value_; }
    bool operator!=(const Value& other) const noexcept { return !(*this == other); }

private:
    ValueType value_;
};

}  // namespace schemata
