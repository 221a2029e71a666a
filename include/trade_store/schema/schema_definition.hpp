// include/trade_store/schema/schema_definition.hpp

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "trade_store/core/error.hpp"

namespace trade_store {

/**
 * @brief SQL flavour used when rendering DDL
 */
enum class SqlDialect {
    POSTGRES,  // BIGSERIAL keys, BIGINT integers, quoted identifiers
    SQLITE     // INTEGER PRIMARY KEY AUTOINCREMENT, bare identifiers
};

std::string dialect_to_string(SqlDialect dialect);
Result<SqlDialect> dialect_from_string(const std::string& name);

/**
 * @brief One column of a table definition
 */
struct ColumnDef {
    std::string name;
    std::string type;  // INTEGER, TEXT, REAL or TIMESTAMP
    bool not_null{false};
    std::optional<std::string> default_value;  // SQL expression, e.g. "0" or "CURRENT_TIMESTAMP"
    bool primary_key{false};
    bool auto_increment{false};

    /**
     * @brief Render the column clause used in CREATE TABLE and ADD COLUMN
     */
    std::string definition(SqlDialect dialect) const;

    /**
     * @brief True when an insert must supply a value for this column
     */
    bool is_required() const {
        return not_null && !default_value && !auto_increment;
    }
};

/**
 * @brief Table-level FOREIGN KEY clause
 */
struct ForeignKeyDef {
    std::string column;
    std::string referenced_table;
    std::string referenced_column;
};

/**
 * @brief One table of the trading schema
 */
struct TableDef {
    std::string name;
    std::vector<ColumnDef> columns;
    std::vector<ForeignKeyDef> foreign_keys;

    const ColumnDef* find_column(const std::string& column_name) const;
    std::vector<std::string> column_names() const;

    /**
     * @brief Name of the primary key column
     */
    const std::string& primary_key() const;
};

/**
 * @brief The six tables of the trading schema in declaration order
 *
 * accounts, trades, positions, price_data, strategy_signals, portfolio_history.
 * Tables referenced by a foreign key come before the tables referencing them.
 */
const std::vector<TableDef>& trading_schema();

/**
 * @brief Look up a table definition by name
 * @return Result with a pointer into trading_schema(), SCHEMA_ERROR if unknown
 */
Result<const TableDef*> find_table(const std::string& table_name);

/**
 * @brief Render "CREATE TABLE IF NOT EXISTS" for one table
 */
std::string render_create_table(const TableDef& table, SqlDialect dialect);

/**
 * @brief Render "ALTER TABLE ... ADD COLUMN" for one column of a table
 */
std::string render_add_column(const TableDef& table, const ColumnDef& column, SqlDialect dialect);

/**
 * @brief Render the whole schema as a script, one statement per table
 */
std::string render_schema_sql(SqlDialect dialect);

}  // namespace trade_store
