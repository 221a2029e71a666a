// include/trade_store/data/store_config.hpp

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "trade_store/core/config_base.hpp"
#include "trade_store/core/error.hpp"
#include "trade_store/core/logger.hpp"

namespace trade_store {

/**
 * @brief Connection string used when neither DATABASE_URL nor a config supplies one
 */
constexpr const char* DEFAULT_CONNECTION_STRING = "postgresql://localhost:5432/trading";

/**
 * @brief Storage engine selection
 */
enum class StoreBackend {
    POSTGRES,  // PostgresStore over libpqxx
    MEMORY     // MemoryStore, optionally persisted to a JSON snapshot
};

std::string backend_to_string(StoreBackend backend);
Result<StoreBackend> backend_from_string(const std::string& name);

/**
 * @brief PostgreSQL connection settings
 *
 * A non-empty url wins over the individual parts. The password is accepted
 * from a config file but never written back by to_json().
 */
struct DatabaseConfig : public ConfigBase {
    std::string url;
    std::string host{"localhost"};
    int port{5432};
    std::string name{"trading"};
    std::string username;
    std::string password;

    /**
     * @brief Compose a libpq URI from the settings
     */
    std::string connection_string() const;

    std::string config_name() const override {
        return "DatabaseConfig";
    }
    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    // Port must be 1-65535 unless a url is given
    Result<void> validate() const override;
};

/**
 * @brief Top-level configuration of a trading store deployment
 */
struct StoreConfig : public ConfigBase {
    StoreBackend backend{StoreBackend::POSTGRES};
    DatabaseConfig database;
    size_t pool_size{5};
    size_t max_pool_size{20};
    std::string snapshot_path;  // MemoryStore snapshot, empty for none
    LoggerConfig logging;

    std::string config_name() const override {
        return "StoreConfig";
    }
    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Check pool bounds, the logging section and, for postgres, the database section
     */
    Result<void> validate() const override;
};

/**
 * @brief Connection string for the configured database
 *
 * The DATABASE_URL environment variable wins over the configuration.
 */
std::string resolve_connection_string(const DatabaseConfig& config);

}  // namespace trade_store
