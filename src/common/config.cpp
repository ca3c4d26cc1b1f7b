/**
 * @file config.cpp
 * @brief Configuration implementation
 */

#include "common/config.hpp"

namespace schemata {

bool CatalogNamespace::is_default() const noexcept {
    return table_catalog == config::kDefaultTableCatalog &&
           table_schema == config::kDefaultTableSchema;
}

std::string CatalogNamespace::to_string() const {
    auto part = [](const std::string& s) {
        return s.empty() ? std::string("<default>") : s;
    };
    return part(table_catalog) + "." + part(table_schema);
}

}  // namespace schemata
