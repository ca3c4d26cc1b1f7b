#pragma once

/**
 * @file emulated_database.hpp
 * @brief In-process database exposing the catalog relations and accepting DDL
 *
 * EmulatedDatabase plays both external collaborators of the metadata core:
 * the catalog fetch primitive (CatalogSource) and the administrative
 * control plane (SchemaAdmin). Every applied DDL batch produces a new schema
 * version. The most recent max_retained_versions versions stay readable
 * through transactions that pinned them; older ones are discarded.
 */

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "admin/schema_admin.hpp"
#include "catalog/catalog_source.hpp"
#include "common/config.hpp"
#include "common/macros.hpp"
#include "emulator/information_schema.hpp"
#include "emulator/schema_snapshot.hpp"
#include "transaction/transaction.hpp"

namespace schemata {

/**
 * @brief Versioned, in-memory schema store
 *
 * Thread safety: All public methods are thread-safe. A batch is applied
 * under the lock, so readers observe either all of it or none of it.
 */
class EmulatedDatabase : public CatalogSource, public SchemaAdmin {
public:
    /**
     * @brief Create an empty database at config::kInitialSchemaVersion
     * @param ns Namespace reported for user tables
     * @param max_retained_versions Versions kept readable, at least 1
     */
    explicit EmulatedDatabase(CatalogNamespace ns = {},
                              size_t max_retained_versions =
                                  config::kMaxRetainedSchemaVersions);

    ~EmulatedDatabase() override = default;

    SCHEMATA_DISALLOW_COPY_AND_MOVE(EmulatedDatabase);

    // ─────────────────────────────────────────────────────────────────────────
    // Snapshots
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Begin a read-only transaction pinning the current version
     */
    [[nodiscard]] std::unique_ptr<Transaction> begin_snapshot();

    [[nodiscard]] schema_version_t current_version() const;

    /**
     * @brief Copy of the schema at the current version
     */
    [[nodiscard]] SchemaSnapshot snapshot() const;

    [[nodiscard]] const CatalogNamespace& catalog_namespace() const noexcept { return ns_; }

    /// Oldest version still readable
    [[nodiscard]] schema_version_t oldest_retained_version() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Fault Injection
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Make the next fetch (of any relation) return the given status
     */
    void fail_next_fetch(Status status);

    /**
     * @brief Make the next update_schema return the given status
     */
    void fail_next_update(Status status);

    [[nodiscard]] size_t fetch_count() const;
    [[nodiscard]] size_t update_count() const;

    // ─────────────────────────────────────────────────────────────────────────
    // CatalogSource
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] Status fetch_columns(const Transaction* txn,
                                       const ConditionList& conditions,
                                       std::vector<ColumnSchemaRow>* out) override;

    [[nodiscard]] Status fetch_indexes(const Transaction* txn,
                                       const ConditionList& conditions,
                                       std::vector<IndexSchemaRow>* out) override;

    [[nodiscard]] Status fetch_index_columns(const Transaction* txn,
                                             const ConditionList& conditions,
                                             std::vector<IndexColumnSchemaRow>* out) override;

    // ─────────────────────────────────────────────────────────────────────────
    // SchemaAdmin
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Parse and apply a DDL batch atomically
     *
     * On success the operation handle is named
     * config::kOperationNamePrefix + <new version> and is already done.
     */
    [[nodiscard]] Status update_schema(const std::vector<std::string>& statements,
                                       OperationHandle* operation) override;

private:
    struct Version {
        Version(SchemaSnapshot s, const CatalogNamespace& ns)
            : snapshot(std::move(s)), relations(snapshot, ns) {}

        SchemaSnapshot snapshot;
        InformationSchema relations;
    };

    /**
     * @brief Resolve the version a fetch reads and consume any injected failure
     */
    Status begin_fetch(const Transaction* txn, std::shared_ptr<const Version>* out);

    template <typename Row>
    Status fetch(const Transaction* txn, const ConditionList& conditions,
                 const std::vector<Row>& (InformationSchema::*relation)() const noexcept,
                 const char* relation_name, std::vector<Row>* out);

    CatalogNamespace ns_;
    size_t max_retained_versions_;
    std::deque<std::shared_ptr<const Version>> history_;  // Oldest first
    txn_id_t next_txn_id_ = 1;
    std::optional<Status> fetch_failure_;
    std::optional<Status> update_failure_;
    size_t fetch_count_ = 0;
    size_t update_count_ = 0;
    mutable std::mutex mutex_;
};

}  // namespace schemata
