#pragma once

/**
 * @file schema_admin.hpp
 * @brief Administrative control-plane collaborator that accepts DDL
 */

#include <string>
#include <vector>

#include "common/status.hpp"
#include "common/types.hpp"

namespace schemata {

/**
 * @brief Tracking handle for a submitted schema update
 */
struct OperationHandle {
  std::string name;  ///< Operation identifier assigned by the control plane
  bool done = false; ///< True once the update is fully applied
  schema_version_t schema_version = INVALID_SCHEMA_VERSION;
};

/**
 * @brief Submits DDL statements to the database
 *
 * Submission is synchronous from the caller's point of view; completion of a
 * long-running update is reported through the handle and is not polled by
 * the metadata core.
 */
class SchemaAdmin {
public:
  virtual ~SchemaAdmin() = default;

  /**
   * @brief Submit a batch of DDL statements
   * @param statements One or more DDL statements, applied in order
   * @param operation Optional handle filled in on success
   * @return kSubmission on failure
   */
  [[nodiscard]] virtual Status
  update_schema(const std::vector<std::string> &statements,
                OperationHandle *operation) = 0;
};

} // namespace schemata
