/**
 * @file models_benchmark.cpp
 * @brief Benchmarks for catalog compilation and schema changes
 */

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

#include <schemata/schemata.hpp>

#include "emulator/emulated_database.hpp"

#include "bench_utils.hpp"

namespace {

void SkipWithStatus(benchmark::State &state, const schemata::Status &status) {
    const std::string message = status.to_string();
    state.SkipWithError(message.c_str());
}

static void BM_Schemata_Models(benchmark::State &state) {
    const int64_t tables = state.range(0);

    schemata::EmulatedDatabase db;
    auto status = schemata::bench::populate(db, tables, 8);
    if (!status.ok()) {
        SkipWithStatus(state, status);
        return;
    }
    schemata::DatabaseMetadata metadata(&db, &db);

    for (auto _ : state) {
        schemata::ModelMap models;
        status = metadata.models(&models);
        if (!status.ok()) {
            SkipWithStatus(state, status);
            return;
        }
        benchmark::DoNotOptimize(models.size());
    }

    state.SetItemsProcessed(state.iterations() * tables);
}

BENCHMARK(BM_Schemata_Models)->Arg(10)->Arg(100)->Arg(500);

static void BM_Schemata_FilteredRead(benchmark::State &state) {
    const int64_t tables = state.range(0);

    schemata::EmulatedDatabase db;
    auto status = schemata::bench::populate(db, tables, 8);
    if (!status.ok()) {
        SkipWithStatus(state, status);
        return;
    }
    schemata::DatabaseMetadata metadata(&db, &db);
    auto txn = db.begin_snapshot();

    for (auto _ : state) {
        schemata::TableSchemaMap schemas;
        status = metadata.tables(txn.get(), &schemas);
        if (!status.ok()) {
            SkipWithStatus(state, status);
            return;
        }
        benchmark::DoNotOptimize(schemas.size());
    }

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_Schemata_FilteredRead)->Arg(100)->Arg(1000);

static void BM_Schemata_AddColumn(benchmark::State &state) {
    const int64_t tables = state.range(0);

    for (auto _ : state) {
        state.PauseTiming();
        schemata::EmulatedDatabase db;
        auto status = schemata::bench::populate(db, tables, 4);
        if (!status.ok()) {
            SkipWithStatus(state, status);
            return;
        }
        schemata::DatabaseMetadata metadata(&db, &db);
        state.ResumeTiming();

        status = metadata.column_update(schemata::AddColumn(
            schemata::bench::table_name(0), "extra",
            schemata::Field(schemata::FieldType::STRING)));
        if (!status.ok()) {
            SkipWithStatus(state, status);
            return;
        }
    }

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_Schemata_AddColumn)->Arg(10)->Arg(100);

}  // namespace
