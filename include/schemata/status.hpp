#pragma once

/**
 * @file status.hpp
 * @brief Public status and error codes for Schemata
 */

#include <string>
#include <string_view>

namespace schemata {

/**
 * @brief Status codes for catalog and migration operations
 */
enum class StatusCode {
    kOk = 0,
    kError,
    kNotFound,
    kAlreadyExists,
    kInvalidArgument,
    kAborted,
    kInternal,

    // Metadata compilation
    kCatalogRead,
    kMissingPrimaryKey,

    // Schema change application
    kUnknownTable,
    kTableAlreadyExists,
    kInvalidSchemaChange,
    kSchemaChangeTypeMismatch,
    kSubmission,
};

/**
 * @brief Status class for operation results
 *
 * Status encapsulates the result of an operation. It can indicate success
 * or failure, and in case of failure, provides an error code and message.
 */
class Status {
public:
    /**
     * @brief Create a success status
     */
    Status() noexcept : code_(StatusCode::kOk) {}

    /**
     * @brief Create a status with the given code
     */
    explicit Status(StatusCode code) noexcept : code_(code) {}

    /**
     * @brief Create a status with code and message
     */
    Status(StatusCode code, std::string message) noexcept
        : code_(code), message_(std::move(message)) {}

    // Factory methods for common statuses
    [[nodiscard]] static Status Ok() noexcept { return Status(); }
    [[nodiscard]] static Status Error(std::string msg = "") { return Status(StatusCode::kError, std::move(msg)); }
    [[nodiscard]] static Status NotFound(std::string msg = "") { return Status(StatusCode::kNotFound, std::move(msg)); }
    [[nodiscard]] static Status AlreadyExists(std::string msg = "") { return Status(StatusCode::kAlreadyExists, std::move(msg)); }
    [[nodiscard]] static Status InvalidArgument(std::string msg = "") { return Status(StatusCode::kInvalidArgument, std::move(msg)); }
    [[nodiscard]] static Status Aborted(std::string msg = "") { return Status(StatusCode::kAborted, std::move(msg)); }
    [[nodiscard]] static Status Internal(std::string msg = "") { return Status(StatusCode::kInternal, std::move(msg)); }

    [[nodiscard]] static Status CatalogRead(std::string msg = "") { return Status(StatusCode::kCatalogRead, std::move(msg)); }
    [[nodiscard]] static Status MissingPrimaryKey(std::string msg = "") { return Status(StatusCode::kMissingPrimaryKey, std::move(msg)); }
    [[nodiscard]] static Status UnknownTable(std::string msg = "") { return Status(StatusCode::kUnknownTable, std::move(msg)); }
    [[nodiscard]] static Status TableAlreadyExists(std::string msg = "") { return Status(StatusCode::kTableAlreadyExists, std::move(msg)); }
    [[nodiscard]] static Status InvalidSchemaChange(std::string msg = "") { return Status(StatusCode::kInvalidSchemaChange, std::move(msg)); }
    [[nodiscard]] static Status SchemaChangeTypeMismatch(std::string msg = "") { return Status(StatusCode::kSchemaChangeTypeMismatch, std::move(msg)); }
    [[nodiscard]] static Status Submission(std::string msg = "") { return Status(StatusCode::kSubmission, std::move(msg)); }

    // Query methods
    [[nodiscard]] bool ok() const noexcept { return code_ == StatusCode::kOk; }
    [[nodiscard]] bool is_error() const noexcept { return code_ != StatusCode::kOk; }
    [[nodiscard]] bool is_not_found() const noexcept { return code_ == StatusCode::kNotFound; }
    [[nodiscard]] bool is_catalog_read() const noexcept { return code_ == StatusCode::kCatalogRead; }
    [[nodiscard]] bool is_missing_primary_key() const noexcept { return code_ == StatusCode::kMissingPrimaryKey; }
    [[nodiscard]] bool is_unknown_table() const noexcept { return code_ == StatusCode::kUnknownTable; }
    [[nodiscard]] bool is_table_already_exists() const noexcept { return code_ == StatusCode::kTableAlreadyExists; }
    [[nodiscard]] bool is_invalid_schema_change() const noexcept { return code_ == StatusCode::kInvalidSchemaChange; }
    [[nodiscard]] bool is_type_mismatch() const noexcept { return code_ == StatusCode::kSchemaChangeTypeMismatch; }
    [[nodiscard]] bool is_submission() const noexcept { return code_ == StatusCode::kSubmission; }

    [[nodiscard]] StatusCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /**
     * @brief Get a human-readable string representation
     */
    [[nodiscard]] std::string to_string() const;

    // Implicit conversion to bool for convenience
    explicit operator bool() const noexcept { return ok(); }

private:
    StatusCode code_;
    std::string message_;
};

}  // namespace schemata
