#pragma once

/**
 * @file macros.hpp
 * @brief Utility macros for Schemata
 */

namespace schemata {

// ─────────────────────────────────────────────────────────────────────────────
// Utility Macros
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Disable copy constructor and assignment
 */
#define SCHEMATA_DISALLOW_COPY(ClassName)          \
    ClassName(const ClassName&) = delete;          \
    ClassName& operator=(const ClassName&) = delete

/**
 * @brief Disable move constructor and assignment
 */
#define SCHEMATA_DISALLOW_MOVE(ClassName)          \
    ClassName(ClassName&&) = delete;               \
    ClassName& operator=(ClassName&&) = delete

/**
 * @brief Disable copy and move
 */
#define SCHEMATA_DISALLOW_COPY_AND_MOVE(ClassName) \
    SCHEMATA_DISALLOW_COPY(ClassName);             \
    SCHEMATA_DISALLOW_MOVE(ClassName)

}  // namespace schemata
