// src/schema/schema_definition.cpp

#include "trade_store/schema/schema_definition.hpp"
#include <sstream>
#include <stdexcept>
#include "trade_store/core/query_builder.hpp"
#include "trade_store/core/types.hpp"

namespace trade_store {

namespace {

ColumnDef serial_key(const std::string& name) {
    ColumnDef column{name, "INTEGER"};
    column.primary_key = true;
    column.auto_increment = true;
    return column;
}

ColumnDef required(const std::string& name, const std::string& type) {
    ColumnDef column{name, type};
    column.not_null = true;
    return column;
}

ColumnDef required_with_default(const std::string& name, const std::string& type,
                                const std::string& default_value) {
    ColumnDef column = required(name, type);
    column.default_value = default_value;
    return column;
}

ColumnDef nullable(const std::string& name, const std::string& type) {
    return ColumnDef{name, type};
}

ColumnDef nullable_with_default(const std::string& name, const std::string& type,
                                const std::string& default_value) {
    ColumnDef column{name, type};
    column.default_value = default_value;
    return column;
}

ForeignKeyDef account_reference() {
    return ForeignKeyDef{"account_id", tables::ACCOUNTS, "account_id"};
}

std::vector<TableDef> build_schema() {
    std::vector<TableDef> schema;

    ColumnDef account_key{"account_id", "INTEGER"};
    account_key.primary_key = true;

    schema.push_back(TableDef{tables::ACCOUNTS,
                              {account_key,
                               required("owner", "TEXT"),
                               required_with_default("created_at", "TIMESTAMP", "CURRENT_TIMESTAMP"),
                               required_with_default("cash_balance", "REAL", "0"),
                               required_with_default("margin_requirement", "REAL", "0"),
                               required_with_default("margin_used", "REAL", "0"),
                               nullable("last_update", "TIMESTAMP")},
                              {}});

    schema.push_back(TableDef{tables::TRADES,
                              {serial_key("trade_id"),
                               required("account_id", "INTEGER"),
                               required("symbol", "TEXT"),
                               required("timestamp", "TIMESTAMP"),
                               required("side", "TEXT"),
                               required("quantity", "REAL"),
                               required("price", "REAL"),
                               nullable_with_default("fee", "REAL", "0"),
                               nullable_with_default("realized_pl", "REAL", "0"),
                               nullable("strategy_name", "TEXT")},
                              {account_reference()}});

    schema.push_back(TableDef{tables::POSITIONS,
                              {serial_key("position_id"),
                               required("account_id", "INTEGER"),
                               required("symbol", "TEXT"),
                               nullable_with_default("long_qty", "REAL", "0"),
                               nullable_with_default("short_qty", "REAL", "0"),
                               nullable_with_default("long_cost_basis", "REAL", "0"),
                               nullable_with_default("short_cost_basis", "REAL", "0"),
                               nullable_with_default("short_margin_used", "REAL", "0"),
                               required("opened_at", "TIMESTAMP"),
                               nullable("closed_at", "TIMESTAMP")},
                              {account_reference()}});

    schema.push_back(TableDef{tables::PRICE_DATA,
                              {serial_key("id"),
                               required("symbol", "TEXT"),
                               required("interval", "TEXT"),
                               required("open_time", "TIMESTAMP"),
                               required("open", "REAL"),
                               required("high", "REAL"),
                               required("low", "REAL"),
                               required("close", "REAL"),
                               required("volume", "REAL"),
                               required("close_time", "TIMESTAMP"),
                               nullable("quote_volume", "REAL"),
                               nullable("count", "INTEGER"),
                               nullable("taker_buy_volume", "REAL"),
                               nullable("taker_buy_quote_volume", "REAL")},
                              {}});

    schema.push_back(TableDef{tables::STRATEGY_SIGNALS,
                              {serial_key("signal_id"),
                               required("symbol", "TEXT"),
                               required("interval", "TEXT"),
                               required("timestamp", "TIMESTAMP"),
                               required("strategy_name", "TEXT"),
                               required("signal", "TEXT"),
                               nullable("confidence", "REAL"),
                               nullable("metrics", "TEXT")},
                              {}});

    schema.push_back(TableDef{tables::PORTFOLIO_HISTORY,
                              {serial_key("record_id"),
                               required("account_id", "INTEGER"),
                               required("timestamp", "TIMESTAMP"),
                               required("portfolio_value", "REAL"),
                               nullable("long_exposure", "REAL"),
                               nullable("short_exposure", "REAL"),
                               nullable("gross_exposure", "REAL"),
                               nullable("net_exposure", "REAL"),
                               nullable("long_short_ratio", "REAL")},
                              {account_reference()}});

    return schema;
}

std::string identifier(const std::string& name, SqlDialect dialect) {
    return dialect == SqlDialect::POSTGRES ? QueryBuilder::quote_identifier(name) : name;
}

// PostgreSQL REAL and INTEGER are 4 bytes; the schema means a double and an int64
std::string column_type(const std::string& type, SqlDialect dialect) {
    if (dialect == SqlDialect::POSTGRES) {
        if (type == "REAL") {
            return "DOUBLE PRECISION";
        }
        if (type == "INTEGER") {
            return "BIGINT";
        }
    }
    return type;
}

}  // namespace

std::string dialect_to_string(SqlDialect dialect) {
    switch (dialect) {
        case SqlDialect::POSTGRES:
            return "postgres";
        case SqlDialect::SQLITE:
            return "sqlite";
        default:
            return "unknown";
    }
}

Result<SqlDialect> dialect_from_string(const std::string& name) {
    if (name == "postgres" || name == "postgresql") {
        return Result<SqlDialect>(SqlDialect::POSTGRES);
    }
    if (name == "sqlite") {
        return Result<SqlDialect>(SqlDialect::SQLITE);
    }
    return make_error<SqlDialect>(ErrorCode::INVALID_ARGUMENT, "Unknown SQL dialect: " + name,
                                  "SchemaDefinition");
}

std::string ColumnDef::definition(SqlDialect dialect) const {
    std::ostringstream ss;
    ss << identifier(name, dialect) << " ";

    if (auto_increment) {
        if (dialect == SqlDialect::POSTGRES) {
            ss << "BIGSERIAL PRIMARY KEY";
        } else {
            ss << type << " PRIMARY KEY AUTOINCREMENT";
        }
        return ss.str();
    }

    ss << column_type(type, dialect);
    if (primary_key) {
        ss << " PRIMARY KEY";
    }
    if (not_null) {
        ss << " NOT NULL";
    }
    if (default_value) {
        ss << " DEFAULT " << *default_value;
    }
    return ss.str();
}

const ColumnDef* TableDef::find_column(const std::string& column_name) const {
    for (const auto& column : columns) {
        if (column.name == column_name) {
            return &column;
        }
    }
    return nullptr;
}

std::vector<std::string> TableDef::column_names() const {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& column : columns) {
        names.push_back(column.name);
    }
    return names;
}

const std::string& TableDef::primary_key() const {
    for (const auto& column : columns) {
        if (column.primary_key) {
            return column.name;
        }
    }
    // Every table in trading_schema() declares a key; reaching here is a programming error
    throw std::logic_error("Table " + name + " has no primary key");
}

const std::vector<TableDef>& trading_schema() {
    static const std::vector<TableDef> schema = build_schema();
    return schema;
}

Result<const TableDef*> find_table(const std::string& table_name) {
    for (const auto& table : trading_schema()) {
        if (table.name == table_name) {
            return Result<const TableDef*>(&table);
        }
    }
    return make_error<const TableDef*>(ErrorCode::SCHEMA_ERROR,
                                       "Unknown table: " + table_name, "SchemaDefinition");
}

std::string render_create_table(const TableDef& table, SqlDialect dialect) {
    std::vector<std::string> clauses;
    for (const auto& column : table.columns) {
        clauses.push_back("    " + column.definition(dialect));
    }
    for (const auto& fk : table.foreign_keys) {
        if (dialect == SqlDialect::POSTGRES) {
            clauses.push_back("    FOREIGN KEY (" + identifier(fk.column, dialect) +
                              ") REFERENCES " + identifier(fk.referenced_table, dialect) + " (" +
                              identifier(fk.referenced_column, dialect) + ")");
        } else {
            clauses.push_back("    FOREIGN KEY (" + fk.column + ") REFERENCES " +
                              fk.referenced_table + "(" + fk.referenced_column + ")");
        }
    }

    return "CREATE TABLE IF NOT EXISTS " + identifier(table.name, dialect) + " (\n" +
           QueryBuilder::join(clauses, ",\n") + "\n);";
}

std::string render_add_column(const TableDef& table, const ColumnDef& column, SqlDialect dialect) {
    return "ALTER TABLE " + identifier(table.name, dialect) + " ADD COLUMN " +
           column.definition(dialect) + ";";
}

std::string render_schema_sql(SqlDialect dialect) {
    std::ostringstream ss;
    ss << "-- SQL initialization script for the trading database\n";
    for (const auto& table : trading_schema()) {
        ss << "\n-- Table: " << table.name << "\n";
        ss << render_create_table(table, dialect) << "\n";
    }
    return ss.str();
}

}  // namespace trade_store
