// src/data/store_config.cpp

#include "trade_store/data/store_config.hpp"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace trade_store {

namespace {

// RFC 3986 percent-encoding; everything but unreserved characters is escaped
std::string uri_encode(const std::string& value) {
    std::string encoded;
    encoded.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            encoded += static_cast<char>(c);
        } else {
            char buffer[4];
            std::snprintf(buffer, sizeof(buffer), "%%%02X", c);
            encoded += buffer;
        }
    }
    return encoded;
}

}  // namespace

std::string backend_to_string(StoreBackend backend) {
    switch (backend) {
        case StoreBackend::POSTGRES:
            return "postgres";
        case StoreBackend::MEMORY:
            return "memory";
        default:
            return "unknown";
    }
}

Result<StoreBackend> backend_from_string(const std::string& name) {
    if (name == "postgres" || name == "postgresql") {
        return Result<StoreBackend>(StoreBackend::POSTGRES);
    }
    if (name == "memory") {
        return Result<StoreBackend>(StoreBackend::MEMORY);
    }
    return make_error<StoreBackend>(ErrorCode::INVALID_ARGUMENT,
                                    "Unknown store backend: " + name, "StoreConfig");
}

std::string DatabaseConfig::connection_string() const {
    if (!url.empty()) {
        return url;
    }

    std::string uri = "postgresql://";
    if (!username.empty()) {
        uri += uri_encode(username);
        if (!password.empty()) {
            uri += ":" + uri_encode(password);
        }
        uri += "@";
    }
    uri += host + ":" + std::to_string(port) + "/" + uri_encode(name);
    return uri;
}

nlohmann::json DatabaseConfig::to_json() const {
    nlohmann::json j;
    if (!url.empty()) {
        j["url"] = url;
    }
    j["host"] = host;
    j["port"] = port;
    j["name"] = name;
    if (!username.empty()) {
        j["username"] = username;
    }
    return j;
}

void DatabaseConfig::from_json(const nlohmann::json& j) {
    read_field(j, "url", url);
    read_field(j, "host", host);
    read_field(j, "port", port);
    read_field(j, "name", name);
    read_field(j, "username", username);
    read_field(j, "password", password);
}

Result<void> DatabaseConfig::validate() const {
    if (url.empty() && (port < 1 || port > 65535)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "port out of range: " + std::to_string(port), config_name());
    }
    return Result<void>();
}

Result<void> StoreConfig::validate() const {
    if (pool_size == 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "pool_size must be at least 1",
                                "StoreConfig");
    }
    if (pool_size > max_pool_size) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "pool_size must not exceed max_pool_size", "StoreConfig");
    }
    if (backend == StoreBackend::POSTGRES) {
        if (database.url.empty() && database.host.empty()) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "database needs either a url or a host", "StoreConfig");
        }
        auto database_check = database.validate();
        if (database_check.is_error()) {
            return database_check;
        }
    }
    return logging.validate();
}

nlohmann::json StoreConfig::to_json() const {
    nlohmann::json j;
    j["backend"] = backend_to_string(backend);
    j["database"] = database.to_json();
    j["pool_size"] = pool_size;
    j["max_pool_size"] = max_pool_size;
    j["snapshot_path"] = snapshot_path;
    j["logging"] = logging.to_json();
    return j;
}

void StoreConfig::from_json(const nlohmann::json& j) {
    if (j.contains("backend")) {
        auto parsed = backend_from_string(j.at("backend").get<std::string>());
        if (parsed.is_error()) {
            throw std::invalid_argument(parsed.error()->what());
        }
        backend = parsed.value();
    }
    if (j.contains("database")) {
        database.from_json(j.at("database"));
    }
    read_field(j, "pool_size", pool_size);
    read_field(j, "max_pool_size", max_pool_size);
    read_field(j, "snapshot_path", snapshot_path);
    if (j.contains("logging")) {
        logging.from_json(j.at("logging"));
    }
}

std::string resolve_connection_string(const DatabaseConfig& config) {
    const char* env_url = std::getenv("DATABASE_URL");
    if (env_url != nullptr && env_url[0] != '\0') {
        return env_url;
    }
    return config.connection_string();
}

}  // namespace trade_store
