// include/trade_store/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "trade_store/core/error.hpp"

namespace trade_store {

/**
 * @brief JSON-backed settings shared by the logger, database and store configs
 *
 * Subclasses map their fields in to_json()/from_json() and state their
 * constraints in validate(). Loading from a file or a JSON value runs both;
 * saving refuses a configuration that does not validate.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Name used as the error component, e.g. "StoreConfig"
     */
    virtual std::string config_name() const = 0;

    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Overwrite the fields present in j; absent keys keep their value
     * @throws std::invalid_argument or nlohmann::json::exception on bad values
     */
    virtual void from_json(const nlohmann::json& j) = 0;

    /**
     * @brief Check field constraints after loading
     */
    virtual Result<void> validate() const {
        return Result<void>();
    }

    /**
     * @brief from_json() followed by validate(), with exceptions mapped to INVALID_ARGUMENT
     */
    Result<void> load_from_json(const nlohmann::json& j);

    /**
     * @brief Read a JSON file and apply it with load_from_json()
     * @return FILE_NOT_FOUND, FILE_IO_ERROR, JSON_PARSE_ERROR or the load_from_json() result
     */
    Result<void> load_from_file(const std::string& filepath);

    /**
     * @brief Validate and write to_json() to filepath
     */
    Result<void> save_to_file(const std::string& filepath) const;

protected:
    template <typename T>
    static void read_field(const nlohmann::json& j, const char* key, T& field) {
        if (j.contains(key)) {
            field = j.at(key).get<T>();
        }
    }
};

}  // namespace trade_store
