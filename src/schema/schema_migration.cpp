// src/schema/schema_migration.cpp

#include "trade_store/schema/schema_migration.hpp"

namespace trade_store {

std::string MigrationStep::describe() const {
    if (kind == Kind::CREATE_TABLE) {
        return "create table " + table;
    }
    return "add column " + table + "." + column;
}

MigrationPlan plan_migration(const ExistingSchema& existing, SqlDialect dialect) {
    MigrationPlan plan;

    for (const auto& table : trading_schema()) {
        auto it = existing.find(table.name);
        if (it == existing.end()) {
            plan.steps.push_back(MigrationStep{MigrationStep::Kind::CREATE_TABLE, table.name, "",
                                               render_create_table(table, dialect)});
            continue;
        }

        const auto& live_columns = it->second;
        for (const auto& column : table.columns) {
            if (live_columns.count(column.name) == 0) {
                plan.steps.push_back(MigrationStep{MigrationStep::Kind::ADD_COLUMN, table.name,
                                                   column.name,
                                                   render_add_column(table, column, dialect)});
            }
        }

        for (const auto& live_column : live_columns) {
            if (table.find_column(live_column) == nullptr) {
                plan.extra_columns.push_back(table.name + "." + live_column);
            }
        }
    }

    return plan;
}

}  // namespace trade_store
