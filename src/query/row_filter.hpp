#pragma once

/**
 * @file row_filter.hpp
 * @brief Reference evaluation of a ConditionList over typed catalog rows
 *
 * Used by in-process implementations of the fetch primitive. Rows are
 * filtered by every FilterCondition and then stably sorted by the order-by
 * keys, so rows that compare equal keep their source order. NULLs sort first
 * in ASC and last in DESC.
 *
 * Row must provide:
 *   static bool has_field(std::string_view name);
 *   std::optional<Value> field(std::string_view name) const;
 */

#include <algorithm>
#include <string>
#include <vector>

#include "common/status.hpp"
#include "query/condition.hpp"

namespace schemata {

template <typename Row>
[[nodiscard]] Status filter_rows(const std::vector<Row> &rows,
                                 const ConditionList &conditions,
                                 std::vector<Row> *out) {
  if (out == nullptr) {
    return Status::InvalidArgument("Output pointer cannot be null");
  }

  std::vector<const FilterCondition *> filters;
  std::vector<OrderByCondition::OrderKey> order_keys;

  for (const auto &condition : conditions) {
    if (condition->type() == ConditionType::ORDER_BY) {
      const auto *order_by =
          static_cast<const OrderByCondition *>(condition.get());
      for (const auto &key : order_by->keys()) {
        if (!Row::has_field(key.first)) {
          return Status::InvalidArgument("Unknown column in ORDER BY: " +
                                         key.first);
        }
        order_keys.push_back(key);
      }
    } else {
      const auto *filter =
          static_cast<const FilterCondition *>(condition.get());
      if (!Row::has_field(filter->column())) {
        return Status::InvalidArgument("Unknown column in filter: " +
                                       filter->column());
      }
      filters.push_back(filter);
    }
  }

  std::vector<Row> result;
  for (const Row &row : rows) {
    bool keep = true;
    for (const FilterCondition *filter : filters) {
      if (!filter->matches(row.field(filter->column()).value_or(Value()))) {
        keep = false;
        break;
      }
    }
    if (keep) {
      result.push_back(row);
    }
  }

  if (!order_keys.empty()) {
    std::stable_sort(result.begin(), result.end(),
                     [&order_keys](const Row &a, const Row &b) {
                       for (const auto &[column, order] : order_keys) {
                         Value va = a.field(column).value_or(Value());
                         Value vb = b.field(column).value_or(Value());
                         int c = va.compare(vb);
                         if (c != 0) {
                           return order == OrderType::ASC ? c < 0 : c > 0;
                         }
                       }
                       return false;
                     });
  }

  *out = std::move(result);
  return Status::Ok();
}

} // namespace schemata
