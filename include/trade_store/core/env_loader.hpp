#pragma once

#include <string>
#include "trade_store/core/error.hpp"

namespace trade_store {

/**
 * @brief Loads KEY=VALUE pairs from a dotenv file into the process environment
 */
class EnvLoader {
public:
    /**
     * @brief Load a dotenv file
     * @param filepath Path to the file
     * @param overwrite Replace variables that are already set
     * @return Result with the number of variables set
     */
    static Result<size_t> load(const std::string& filepath, bool overwrite = false);

    /**
     * @brief Look up the nearest dotenv file from a directory upwards
     * @param start_dir Directory to start from
     * @param filename Name of the file to look for
     * @return Result with the path, DATA_NOT_FOUND if there is none
     */
    static Result<std::string> find(const std::string& start_dir, const std::string& filename = ".env");
};

}  // namespace trade_store
