/**
 * @file basic_usage.cpp
 * @brief Basic usage example for Schemata
 */

#include <iostream>

#include <schemata/schemata.hpp>

#include "common/logger.hpp"
#include "emulator/emulated_database.hpp"

namespace {

void print_models(const schemata::ModelMap& models) {
    for (const auto& [table, model] : models) {
        std::cout << "  " << table << " (";
        const char* sep = "";
        for (const auto& key : model.primary_index_keys()) {
            std::cout << sep << key;
            sep = ", ";
        }
        std::cout << ")\n";
        for (const auto& [column, field] : model.schema()) {
            std::cout << "    " << column << " " << field.ddl() << "\n";
        }
        for (const auto& [index, info] : model.indexes()) {
            std::cout << "    index " << index << " [" << info.type << "]\n";
        }
    }
}

}  // namespace

int main() {
    schemata::Logger::init("schemata", spdlog::level::info);
    std::cout << "Schemata v" << schemata::version() << "\n\n";

    schemata::EmulatedDatabase db;
    schemata::DatabaseMetadata metadata(&db, &db);

    // Create a table
    schemata::CreateTableUpdate users(
        "Users",
        {{"id", schemata::Field(schemata::FieldType::INT64, false)},
         {"name", schemata::Field(schemata::FieldType::STRING)}},
        {"id"});
    schemata::SchemaChangeResult result;
    auto status = metadata.create_table(users, &result);
    if (!status.ok()) {
        std::cerr << "CREATE TABLE failed: " << status.to_string() << "\n";
        return 1;
    }
    std::cout << "Submitted: " << result.ddl.front() << "\n";
    std::cout << "  operation " << result.operation.name << "\n";

    // Add a column and an index over it
    status = metadata.column_update(
        schemata::AddColumn("Users", "email", schemata::Field(schemata::FieldType::STRING)),
        &result);
    if (!status.ok()) {
        std::cerr << "ADD COLUMN failed: " << status.to_string() << "\n";
        return 1;
    }
    std::cout << "Submitted: " << result.ddl.front() << "\n";

    schemata::CreateIndex::Options options;
    options.unique = true;
    status = metadata.index_update(
        schemata::CreateIndex("Users", "UsersByEmail", {"email"}, options), &result);
    if (!status.ok()) {
        std::cerr << "CREATE INDEX failed: " << status.to_string() << "\n";
        return 1;
    }
    std::cout << "Submitted: " << result.ddl.front() << "\n";

    // A rejected change never reaches the database
    status = metadata.column_update(schemata::DropColumn("Users", "id"), &result);
    std::cout << "DROP COLUMN id: " << status.to_string() << " ("
              << schemata::schema_change_state_to_string(result.state) << ")\n";

    // Compile the catalog into models
    schemata::ModelMap models;
    status = metadata.models(&models);
    if (!status.ok()) {
        std::cerr << "Catalog read failed: " << status.to_string() << "\n";
        return 1;
    }
    std::cout << "\nModels at schema version " << db.current_version() << ":\n";
    print_models(models);

    schemata::Logger::shutdown();
    return 0;
}
