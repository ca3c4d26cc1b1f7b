#pragma once

/**
 * @file schemata.hpp
 * @brief Main include header for Schemata
 *
 * Include this single header to access the metadata facade and the schema
 * update requests. The emulated database lives in the separate
 * schemata_emulator library (emulator/emulated_database.hpp).
 */

#include "schemata/status.hpp"

#include "metadata/database_metadata.hpp"
#include "schema/column_update.hpp"
#include "schema/create_table_update.hpp"
#include "schema/index_update.hpp"

namespace schemata {

/**
 * @brief Get the version string of Schemata
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* version() noexcept {
    return "0.1.0";
}

/**
 * @brief Get the major version number
 */
constexpr int version_major() noexcept {
    return 0;
}

/**
 * @brief Get the minor version number
 */
constexpr int version_minor() noexcept {
    return 1;
}

/**
 * @brief Get the patch version number
 */
constexpr int version_patch() noexcept {
    return 0;
}

}  // namespace schemata
