// include/trade_store/schema/schema_migration.hpp

#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>
#include "trade_store/schema/schema_definition.hpp"

namespace trade_store {

/**
 * @brief Live catalog: table name to the set of its column names
 */
using ExistingSchema = std::map<std::string, std::set<std::string>>;

/**
 * @brief One DDL statement needed to bring a database up to trading_schema()
 */
struct MigrationStep {
    enum class Kind { CREATE_TABLE, ADD_COLUMN };

    Kind kind{Kind::CREATE_TABLE};
    std::string table;
    std::string column;  // empty for CREATE_TABLE
    std::string statement;

    std::string describe() const;
};

/**
 * @brief Outcome of comparing a catalog with trading_schema()
 */
struct MigrationPlan {
    std::vector<MigrationStep> steps;

    // "table.column" entries present in the catalog but unknown to the schema.
    // Reported only; nothing is ever dropped.
    std::vector<std::string> extra_columns;

    bool empty() const {
        return steps.empty();
    }
};

/**
 * @brief Plan the statements that create missing tables and add missing columns
 *
 * Tables come out in schema declaration order, so a referenced table is always
 * created before the tables pointing at it. Columns are added in their
 * declared position order. Tables the schema does not know are ignored.
 *
 * @param existing Catalog of the target database
 * @param dialect SQL flavour of the generated statements
 * @return Plan, empty when the database already matches
 */
MigrationPlan plan_migration(const ExistingSchema& existing, SqlDialect dialect);

}  // namespace trade_store
