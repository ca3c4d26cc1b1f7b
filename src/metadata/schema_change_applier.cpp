/**
 * @file schema_change_applier.cpp
 * @brief SchemaChangeApplier implementation
 */

#include "metadata/schema_change_applier.hpp"

#include "catalog/model_synthesizer.hpp"
#include "common/logger.hpp"

namespace schemata {

const char *schema_change_state_to_string(SchemaChangeState state) {
  switch (state) {
  case SchemaChangeState::RECEIVED:
    return "RECEIVED";
  case SchemaChangeState::VALIDATED:
    return "VALIDATED";
  case SchemaChangeState::DDL_EMITTED:
    return "DDL_EMITTED";
  case SchemaChangeState::SUBMITTED:
    return "SUBMITTED";
  case SchemaChangeState::REJECTED:
    return "REJECTED";
  }
  return "UNKNOWN";
}

SchemaChangeApplier::SchemaChangeApplier(const CatalogReader *reader,
                                         SchemaAdmin *admin)
    : reader_(reader), admin_(admin) {}

Status SchemaChangeApplier::apply_column_update(const SchemaUpdate &update,
                                                SchemaChangeResult *result,
                                                const Transaction *txn) {
  return apply(SchemaUpdateKind::COLUMN, update, result, txn);
}

Status SchemaChangeApplier::apply_create_table_update(
    const SchemaUpdate &update, SchemaChangeResult *result,
    const Transaction *txn) {
  return apply(SchemaUpdateKind::CREATE_TABLE, update, result, txn);
}

Status SchemaChangeApplier::apply_index_update(const SchemaUpdate &update,
                                               SchemaChangeResult *result,
                                               const Transaction *txn) {
  return apply(SchemaUpdateKind::INDEX, update, result, txn);
}

Status SchemaChangeApplier::apply(SchemaUpdateKind expected,
                                  const SchemaUpdate &update,
                                  SchemaChangeResult *result,
                                  const Transaction *txn) {
  SchemaChangeResult local;
  SchemaChangeResult &outcome = result != nullptr ? *result : local;
  outcome = SchemaChangeResult{};

  auto finish = [&outcome](SchemaChangeState state, Status status) {
    outcome.state = state;
    outcome.status = status;
    return status;
  };

  // Wrong variant for this entry point: fail before touching the catalog.
  if (update.kind() != expected) {
    LOG_ERROR("{} passed where a {} was expected (table {})",
              schema_update_kind_to_string(update.kind()),
              schema_update_kind_to_string(expected), update.table());
    return finish(SchemaChangeState::REJECTED,
                  Status::SchemaChangeTypeMismatch(
                      std::string("Expected ") +
                      schema_update_kind_to_string(expected) + ", got " +
                      schema_update_kind_to_string(update.kind())));
  }
  if (reader_ == nullptr || admin_ == nullptr) {
    return finish(SchemaChangeState::REJECTED,
                  Status::Internal("Schema change applier is not configured"));
  }

  ModelMap models;
  Status status = ModelSynthesizer::load(*reader_, txn, &models);
  if (!status.ok()) {
    LOG_WARN("Cannot read current schema for {}: {}", update.table(),
             status.to_string());
    return finish(SchemaChangeState::REJECTED, status);
  }

  const Model *model = nullptr;
  auto it = models.find(update.table());
  if (expected == SchemaUpdateKind::CREATE_TABLE) {
    if (it != models.end()) {
      LOG_WARN("Rejected {}: table {} already exists",
               schema_update_kind_to_string(expected), update.table());
      return finish(SchemaChangeState::REJECTED,
                    Status::TableAlreadyExists("Table already exists: " +
                                               update.table()));
    }
  } else {
    if (it == models.end()) {
      LOG_WARN("Rejected {}: unknown table {}",
               schema_update_kind_to_string(expected), update.table());
      return finish(SchemaChangeState::REJECTED,
                    Status::UnknownTable("Table not found: " + update.table()));
    }
    model = &it->second;
  }

  status = update.validate(model);
  if (status.ok()) {
    status = update.validate_names(models);
  }
  if (!status.ok()) {
    if (!status.is_invalid_schema_change()) {
      status = Status::InvalidSchemaChange(std::string(status.message()));
    }
    LOG_WARN("Rejected {} on {}: {}", schema_update_kind_to_string(expected),
             update.table(), status.message());
    return finish(SchemaChangeState::REJECTED, status);
  }
  outcome.state = SchemaChangeState::VALIDATED;

  outcome.ddl.push_back(update.ddl(model));
  outcome.state = SchemaChangeState::DDL_EMITTED;
  LOG_DEBUG("{} on {} emitted: {}", schema_update_kind_to_string(expected),
            update.table(), outcome.ddl.front());

  LOG_INFO("Submitting schema update: {}", outcome.ddl.front());
  status = admin_->update_schema(outcome.ddl, &outcome.operation);
  if (!status.ok()) {
    if (!status.is_submission()) {
      status = Status::Submission(status.to_string());
    }
    LOG_WARN("Schema update for {} failed: {}", update.table(),
             status.to_string());
    return finish(SchemaChangeState::DDL_EMITTED, status);
  }

  return finish(SchemaChangeState::SUBMITTED, Status::Ok());
}

} // namespace schemata
