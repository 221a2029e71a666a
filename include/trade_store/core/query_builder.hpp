#pragma once

#include <sstream>
#include <string>
#include <vector>

namespace trade_store {

/**
 * @brief Helper class for building SQL text
 *
 * Provides consistent quoting of identifiers for statements
 * whose shape is only known at runtime (DDL, column lists).
 */
class QueryBuilder {
public:
    /**
     * @brief Quote an identifier (table or column name)
     * @param name The identifier
     * @return Double-quoted identifier with embedded quotes doubled
     */
    static std::string quote_identifier(const std::string& name) {
        std::string result = "\"";
        for (char c : name) {
            if (c == '"') {
                result += "\"\"";
            } else {
                result += c;
            }
        }
        result += "\"";
        return result;
    }

    /**
     * @brief Join elements with a delimiter
     */
    static std::string join(const std::vector<std::string>& elements,
                            const std::string& delimiter) {
        std::ostringstream os;
        if (!elements.empty()) {
            os << elements[0];
            for (size_t i = 1; i < elements.size(); ++i) {
                os << delimiter << elements[i];
            }
        }
        return os.str();
    }

    /**
     * @brief Build "INSERT INTO table (c1, c2) VALUES (v1, v2)" from pre-quoted values
     * @param table Table name
     * @param columns Column names (quoted by this function)
     * @param values SQL literals or placeholders, one per column
     * @return INSERT statement without a trailing clause
     */
    static std::string insert_into(const std::string& table,
                                   const std::vector<std::string>& columns,
                                   const std::vector<std::string>& values) {
        std::vector<std::string> quoted;
        quoted.reserve(columns.size());
        for (const auto& column : columns) {
            quoted.push_back(quote_identifier(column));
        }
        return "INSERT INTO " + quote_identifier(table) + " (" + join(quoted, ", ") +
               ") VALUES (" + join(values, ", ") + ")";
    }
};

}  // namespace trade_store
