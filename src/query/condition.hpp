#pragma once

/**
 * @file condition.hpp
 * @brief Predicates accepted by the catalog fetch primitive
 *
 * A fetch takes an ordered list of conditions:
 * - EqualityCondition:   COLUMN = value   (value NULL means IS NULL)
 * - InequalityCondition: COLUMN != value  (value NULL means IS NOT NULL)
 * - OrderByCondition:    ORDER BY COLUMN ASC|DESC, ...
 *
 * Filters are conjunctive. Order-by keys of several OrderByConditions are
 * applied in list order.
 */

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "query/value.hpp"

namespace schemata {

// ─────────────────────────────────────────────────────────────────────────────
// Condition Types
// ─────────────────────────────────────────────────────────────────────────────

enum class ConditionType {
  EQUALITY,
  INEQUALITY,
  ORDER_BY,
};

enum class OrderType {
  ASC,
  DESC,
};

// ─────────────────────────────────────────────────────────────────────────────
// Condition Base Class
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Base class for all fetch conditions
 */
class Condition {
public:
  explicit Condition(ConditionType type) : type_(type) {}
  virtual ~Condition() = default;

  [[nodiscard]] ConditionType type() const noexcept { return type_; }

  /**
   * @brief SQL fragment for this condition, without WHERE/ORDER BY keyword
   */
  [[nodiscard]] virtual std::string to_sql() const = 0;

  /**
   * @brief Create a deep copy of this condition
   */
  [[nodiscard]] virtual std::unique_ptr<Condition> clone() const = 0;

private:
  ConditionType type_;
};

using ConditionList = std::vector<std::unique_ptr<Condition>>;

// ─────────────────────────────────────────────────────────────────────────────
// Filter Conditions
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief A condition comparing one column against a value
 */
class FilterCondition : public Condition {
public:
  FilterCondition(ConditionType type, std::string column, Value value)
      : Condition(type), column_(std::move(column)), value_(std::move(value)) {}

  [[nodiscard]] const std::string &column() const noexcept { return column_; }
  [[nodiscard]] const Value &value() const noexcept { return value_; }

  /**
   * @brief Evaluate against the row's cell for column()
   */
  [[nodiscard]] virtual bool matches(const Value &cell) const = 0;

private:
  std::string column_;
  Value value_;
};

/**
 * @brief COLUMN = value, or COLUMN IS NULL
 */
class EqualityCondition : public FilterCondition {
public:
  EqualityCondition(std::string column, Value value)
      : FilterCondition(ConditionType::EQUALITY, std::move(column),
                        std::move(value)) {}

  [[nodiscard]] bool matches(const Value &cell) const override;
  [[nodiscard]] std::string to_sql() const override;
  [[nodiscard]] std::unique_ptr<Condition> clone() const override;
};

/**
 * @brief COLUMN != value, or COLUMN IS NOT NULL
 *
 * A NULL cell never satisfies a comparison against a non-NULL value.
 */
class InequalityCondition : public FilterCondition {
public:
  InequalityCondition(std::string column, Value value)
      : FilterCondition(ConditionType::INEQUALITY, std::move(column),
                        std::move(value)) {}

  [[nodiscard]] bool matches(const Value &cell) const override;
  [[nodiscard]] std::string to_sql() const override;
  [[nodiscard]] std::unique_ptr<Condition> clone() const override;
};

// ─────────────────────────────────────────────────────────────────────────────
// Order By
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief ORDER BY key list
 */
class OrderByCondition : public Condition {
public:
  using OrderKey = std::pair<std::string, OrderType>;

  explicit OrderByCondition(std::vector<OrderKey> keys)
      : Condition(ConditionType::ORDER_BY), keys_(std::move(keys)) {}

  OrderByCondition(std::string column, OrderType order)
      : OrderByCondition(std::vector<OrderKey>{{std::move(column), order}}) {}

  [[nodiscard]] const std::vector<OrderKey> &keys() const noexcept {
    return keys_;
  }

  [[nodiscard]] std::string to_sql() const override;
  [[nodiscard]] std::unique_ptr<Condition> clone() const override;

private:
  std::vector<OrderKey> keys_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Render a list as "WHERE a AND b ORDER BY c ASC" (parts omitted when
 * empty)
 */
[[nodiscard]] std::string conditions_to_sql(const ConditionList &conditions);

/**
 * @brief Deep copy of a condition list
 */
[[nodiscard]] ConditionList clone_conditions(const ConditionList &conditions);

} // namespace schemata
