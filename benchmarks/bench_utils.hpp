#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <schemata/schemata.hpp>

#include "emulator/emulated_database.hpp"

namespace schemata::bench {

inline std::string table_name(int64_t i) { return "Table" + std::to_string(i); }

/// CREATE TABLE statements for @p tables tables of @p columns columns each,
/// every table with one secondary index storing its last column
inline std::vector<std::string> make_schema_ddl(int64_t tables, int64_t columns) {
    std::vector<std::string> ddl;
    for (int64_t t = 0; t < tables; ++t) {
        const std::string table = table_name(t);
        std::string create = "CREATE TABLE " + table + " (id INT64 NOT NULL";
        for (int64_t c = 1; c < columns; ++c) {
            create += ", c" + std::to_string(c) + " STRING(MAX)";
        }
        create += ") PRIMARY KEY (id)";
        ddl.push_back(create);

        if (columns > 2) {
            ddl.push_back("CREATE INDEX " + table + "ByC1 ON " + table +
                          " (c1) STORING (c" + std::to_string(columns - 1) + ")");
        }
    }
    return ddl;
}

inline Status populate(EmulatedDatabase& db, int64_t tables, int64_t columns) {
    OperationHandle operation;
    return db.update_schema(make_schema_ddl(tables, columns), &operation);
}

}  // namespace schemata::bench
