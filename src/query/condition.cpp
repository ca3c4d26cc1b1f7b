/**
 * @file condition.cpp
 * @brief Fetch condition implementations
 */

#include "query/condition.hpp"

namespace schemata {

// ─────────────────────────────────────────────────────────────────────────────
// EqualityCondition
// ─────────────────────────────────────────────────────────────────────────────

bool EqualityCondition::matches(const Value &cell) const {
  if (value().is_null()) {
    return cell.is_null();
  }
  return !cell.is_null() && cell == value();
}

std::string EqualityCondition::to_sql() const {
  if (value().is_null()) {
    return column() + " IS NULL";
  }
  return column() + " = " + value().to_string();
}

std::unique_ptr<Condition> EqualityCondition::clone() const {
  return std::make_unique<EqualityCondition>(column(), value());
}

// ─────────────────────────────────────────────────────────────────────────────
// InequalityCondition
// ─────────────────────────────────────────────────────────────────────────────

bool InequalityCondition::matches(const Value &cell) const {
  if (value().is_null()) {
    return !cell.is_null();
  }
  return !cell.is_null() && cell != value();
}

std::string InequalityCondition::to_sql() const {
  if (value().is_null()) {
    return column() + " IS NOT NULL";
  }
  return column() + " != " + value().to_string();
}

std::unique_ptr<Condition> InequalityCondition::clone() const {
  return std::make_unique<InequalityCondition>(column(), value());
}

// ─────────────────────────────────────────────────────────────────────────────
// OrderByCondition
// ─────────────────────────────────────────────────────────────────────────────

std::string OrderByCondition::to_sql() const {
  std::string sql;
  for (const auto &[column, order] : keys_) {
    if (!sql.empty()) {
      sql += ", ";
    }
    sql += column;
    sql += order == OrderType::ASC ? " ASC" : " DESC";
  }
  return sql;
}

std::unique_ptr<Condition> OrderByCondition::clone() const {
  return std::make_unique<OrderByCondition>(keys_);
}

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

std::string conditions_to_sql(const ConditionList &conditions) {
  std::string where;
  std::string order_by;

  for (const auto &condition : conditions) {
    if (condition->type() == ConditionType::ORDER_BY) {
      order_by += order_by.empty() ? "ORDER BY " : ", ";
      order_by += condition->to_sql();
    } else {
      where += where.empty() ? "WHERE " : " AND ";
      where += condition->to_sql();
    }
  }

  if (where.empty()) {
    return order_by;
  }
  if (order_by.empty()) {
    return where;
  }
  return where + " " + order_by;
}

ConditionList clone_conditions(const ConditionList &conditions) {
  ConditionList copy;
  copy.reserve(conditions.size());
  for (const auto &condition : conditions) {
    copy.push_back(condition->clone());
  }
  return copy;
}

} // namespace schemata
