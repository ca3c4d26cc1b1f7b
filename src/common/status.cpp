/**
 * @file status.cpp
 * @brief Status class implementation
 */

#include "schemata/status.hpp"

namespace schemata {

std::string Status::to_string() const {
    std::string result;

    switch (code_) {
        case StatusCode::kOk:                       result = "OK"; break;
        case StatusCode::kError:                    result = "Error"; break;
        case StatusCode::kNotFound:                 result = "NotFound"; break;
        case StatusCode::kAlreadyExists:            result = "AlreadyExists"; break;
        case StatusCode::kInvalidArgument:          result = "InvalidArgument"; break;
        case StatusCode::kAborted:                  result = "Aborted"; break;
        case StatusCode::kInternal:                 result = "Internal"; break;
        case StatusCode::kCatalogRead:              result = "CatalogReadError"; break;
        case StatusCode::kMissingPrimaryKey:        result = "MissingPrimaryKey"; break;
        case StatusCode::kUnknownTable:             result = "UnknownTable"; break;
        case StatusCode::kTableAlreadyExists:       result = "TableAlreadyExists"; break;
        case StatusCode::kInvalidSchemaChange:      result = "InvalidSchemaChange"; break;
        case StatusCode::kSchemaChangeTypeMismatch: result = "SchemaChangeTypeMismatch"; break;
        case StatusCode::kSubmission:               result = "SubmissionError"; break;
    }

    if (!message_.empty()) {
        result += ": ";
        result += message_;
    }

    return result;
}

}  // namespace schemata
