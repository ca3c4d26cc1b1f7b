#pragma once

/**
 * @file transaction.hpp
 * @brief Read-only transaction handle pinning one catalog snapshot
 *
 * A Transaction is opaque to the metadata core: CatalogReader forwards it to
 * every fetch so that reads issued with the same handle observe one schema
 * version. The fetch primitive interprets read_version().
 *
 * State machine:
 *   ACTIVE -> COMMITTED | ABORTED
 */

#include <cstdint>

#include "common/types.hpp"

namespace schemata {

// ─────────────────────────────────────────────────────────────────────────────
// Transaction State Machine
// ─────────────────────────────────────────────────────────────────────────────

enum class TransactionState : uint8_t {
    ACTIVE = 0,     // Reads allowed
    COMMITTED = 1,  // Closed normally
    ABORTED = 2     // Closed after an error
};

/**
 * @brief Convert transaction state to string for debugging
 */
[[nodiscard]] inline const char* transaction_state_to_string(TransactionState state) {
    switch (state) {
        case TransactionState::ACTIVE:
            return "ACTIVE";
        case TransactionState::COMMITTED:
            return "COMMITTED";
        case TransactionState::ABORTED:
            return "ABORTED";
        default:
            return "UNKNOWN";
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Transaction Class
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Snapshot handle shared by the reads of one metadata request
 *
 * Thread safety: Individual Transaction objects are NOT thread-safe.
 */
class Transaction {
public:
    /**
     * @brief Create a transaction reading at the given schema version
     */
    Transaction(txn_id_t txn_id, schema_version_t read_version);

    ~Transaction() = default;

    // Non-copyable, movable
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&&) = default;
    Transaction& operator=(Transaction&&) = default;

    [[nodiscard]] txn_id_t txn_id() const noexcept { return txn_id_; }
    [[nodiscard]] schema_version_t read_version() const noexcept { return read_version_; }
    [[nodiscard]] TransactionState state() const noexcept { return state_; }

    [[nodiscard]] bool is_active() const noexcept {
        return state_ == TransactionState::ACTIVE;
    }

    void commit() noexcept { state_ = TransactionState::COMMITTED; }
    void abort() noexcept { state_ = TransactionState::ABORTED; }

private:
    txn_id_t txn_id_;
    schema_version_t read_version_;
    TransactionState state_ = TransactionState::ACTIVE;
};

}  // namespace schemata
