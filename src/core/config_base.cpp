// src/core/config_base.cpp

#include "trade_store/core/config_base.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace trade_store {

Result<void> ConfigBase::load_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                config_name() + " must be a JSON object", config_name());
    }

    try {
        from_json(j);
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                std::string("Wrong value type: ") + e.what(), config_name());
    } catch (const std::invalid_argument& e) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                std::string("Invalid value: ") + e.what(), config_name());
    }
    return validate();
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    if (!std::filesystem::exists(filepath)) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND, "Config file not found: " + filepath,
                                config_name());
    }

    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open file for reading: " + filepath, config_name());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Malformed config file " + filepath + ": " + e.what(),
                                config_name());
    }
    return load_from_json(j);
}

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    auto validation = validate();
    if (validation.is_error()) {
        return validation;
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open file for writing: " + filepath, config_name());
    }
    file << std::setw(4) << to_json() << std::endl;
    if (!file) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed to write " + filepath,
                                config_name());
    }
    return Result<void>();
}

}  // namespace trade_store
