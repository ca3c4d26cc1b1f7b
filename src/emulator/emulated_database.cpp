/**
 * @file emulated_database.cpp
 * @brief EmulatedDatabase implementation
 */

#include "emulator/emulated_database.hpp"

#include <algorithm>

#include "common/logger.hpp"
#include "ddl/ddl_parser.hpp"
#include "query/row_filter.hpp"

namespace schemata {

EmulatedDatabase::EmulatedDatabase(CatalogNamespace ns, size_t max_retained_versions)
    : ns_(std::move(ns)), max_retained_versions_(std::max<size_t>(max_retained_versions, 1)) {
    SchemaSnapshot initial;
    initial.set_version(config::kInitialSchemaVersion);
    history_.push_back(std::make_shared<Version>(std::move(initial), ns_));
}

// ─────────────────────────────────────────────────────────────────────────────
// Snapshots
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<Transaction> EmulatedDatabase::begin_snapshot() {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_unique<Transaction>(next_txn_id_++,
                                         history_.back()->snapshot.version());
}

schema_version_t EmulatedDatabase::current_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.back()->snapshot.version();
}

schema_version_t EmulatedDatabase::oldest_retained_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.front()->snapshot.version();
}

SchemaSnapshot EmulatedDatabase::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.back()->snapshot;
}

// ─────────────────────────────────────────────────────────────────────────────
// Fault Injection
// ─────────────────────────────────────────────────────────────────────────────

void EmulatedDatabase::fail_next_fetch(Status status) {
    std::lock_guard<std::mutex> lock(mutex_);
    fetch_failure_ = std::move(status);
}

void EmulatedDatabase::fail_next_update(Status status) {
    std::lock_guard<std::mutex> lock(mutex_);
    update_failure_ = std::move(status);
}

size_t EmulatedDatabase::fetch_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetch_count_;
}

size_t EmulatedDatabase::update_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return update_count_;
}

// ─────────────────────────────────────────────────────────────────────────────
// CatalogSource
// ─────────────────────────────────────────────────────────────────────────────

Status EmulatedDatabase::begin_fetch(const Transaction* txn,
                                     std::shared_ptr<const Version>* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    fetch_count_++;

    if (fetch_failure_.has_value()) {
        Status failure = std::move(*fetch_failure_);
        fetch_failure_.reset();
        return failure;
    }

    if (txn == nullptr) {
        *out = history_.back();
        return Status::Ok();
    }
    if (!txn->is_active()) {
        return Status::CatalogRead("Transaction " + std::to_string(txn->txn_id()) + " is " +
                                   transaction_state_to_string(txn->state()));
    }

    schema_version_t oldest = history_.front()->snapshot.version();
    schema_version_t version = txn->read_version();
    if (version < oldest) {
        return Status::CatalogRead("Schema version " + std::to_string(version) +
                                   " is no longer retained (oldest is " +
                                   std::to_string(oldest) + ")");
    }
    if (version - oldest >= history_.size()) {
        return Status::CatalogRead("Schema version " + std::to_string(version) +
                                   " is not available");
    }
    *out = history_[version - oldest];
    return Status::Ok();
}

template <typename Row>
Status EmulatedDatabase::fetch(const Transaction* txn, const ConditionList& conditions,
                               const std::vector<Row>& (InformationSchema::*relation)()
                                   const noexcept,
                               const char* relation_name, std::vector<Row>* out) {
    if (out == nullptr) {
        return Status::InvalidArgument("Output pointer cannot be null");
    }

    std::shared_ptr<const Version> version;
    SCHEMATA_RETURN_IF_ERROR(begin_fetch(txn, &version));

    // The version is immutable, so filtering happens outside the lock
    std::vector<Row> rows;
    Status status = filter_rows(((version->relations).*relation)(), conditions, &rows);
    if (!status.ok()) {
        return Status::CatalogRead(std::string(relation_name) + ": " + status.to_string());
    }

    LOG_TRACE("Read {} row(s) from {} at version {}: {}", rows.size(), relation_name,
              version->snapshot.version(), conditions_to_sql(conditions));
    *out = std::move(rows);
    return Status::Ok();
}

Status EmulatedDatabase::fetch_columns(const Transaction* txn,
                                       const ConditionList& conditions,
                                       std::vector<ColumnSchemaRow>* out) {
    return fetch(txn, conditions, &InformationSchema::columns, config::kColumnsRelation, out);
}

Status EmulatedDatabase::fetch_indexes(const Transaction* txn,
                                       const ConditionList& conditions,
                                       std::vector<IndexSchemaRow>* out) {
    return fetch(txn, conditions, &InformationSchema::indexes, config::kIndexesRelation, out);
}

Status EmulatedDatabase::fetch_index_columns(const Transaction* txn,
                                             const ConditionList& conditions,
                                             std::vector<IndexColumnSchemaRow>* out) {
    return fetch(txn, conditions, &InformationSchema::index_columns,
                 config::kIndexColumnsRelation, out);
}

// ─────────────────────────────────────────────────────────────────────────────
// SchemaAdmin
// ─────────────────────────────────────────────────────────────────────────────

Status EmulatedDatabase::update_schema(const std::vector<std::string>& statements,
                                       OperationHandle* operation) {
    std::lock_guard<std::mutex> lock(mutex_);
    update_count_++;

    if (update_failure_.has_value()) {
        Status failure = std::move(*update_failure_);
        update_failure_.reset();
        return failure;
    }
    if (statements.empty()) {
        return Status::Submission("Schema update contains no statements");
    }

    SchemaSnapshot working = history_.back()->snapshot;
    for (size_t i = 0; i < statements.size(); i++) {
        std::unique_ptr<DdlStatement> stmt;
        DdlParser parser(statements[i]);
        Status status = parser.parse(&stmt);
        if (status.ok()) {
            SchemaSnapshot next;
            status = working.apply(*stmt, &next);
            if (status.ok()) {
                working = std::move(next);
            }
        }
        if (!status.ok()) {
            LOG_WARN("Rejected schema update statement {}: {}", i, status.to_string());
            return Status::Submission("Statement " + std::to_string(i) + " (" +
                                      statements[i] + "): " + status.to_string());
        }
    }

    schema_version_t version = history_.back()->snapshot.version() + 1;
    working.set_version(version);
    history_.push_back(std::make_shared<Version>(std::move(working), ns_));
    while (history_.size() > max_retained_versions_) {
        LOG_DEBUG("Discarding schema version {}", history_.front()->snapshot.version());
        history_.pop_front();
    }

    LOG_INFO("Applied {} DDL statement(s), schema version {}", statements.size(), version);

    if (operation != nullptr) {
        operation->name = config::kOperationNamePrefix + std::to_string(version);
        operation->done = true;
        operation->schema_version = version;
    }
    return Status::Ok();
}

}  // namespace schemata
