/**
 * @file transaction.cpp
 * @brief Transaction implementation
 */

#include "transaction/transaction.hpp"

namespace schemata {

Transaction::Transaction(txn_id_t txn_id, schema_version_t read_version)
    : txn_id_(txn_id)
    , read_version_(read_version) {}

}  // namespace schemata
