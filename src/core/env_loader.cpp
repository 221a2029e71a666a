#include "trade_store/core/env_loader.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace trade_store {

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

}  // namespace

Result<size_t> EnvLoader::load(const std::string& filepath, bool overwrite) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<size_t>(ErrorCode::FILE_NOT_FOUND,
                                  "Failed to open .env file: " + filepath, "EnvLoader");
    }

    size_t loaded = 0;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        size_t delimiter_pos = line.find('=');
        if (delimiter_pos == std::string::npos || delimiter_pos == 0) {
            continue;
        }

        std::string key = trim(line.substr(0, delimiter_pos));
        std::string value = unquote(trim(line.substr(delimiter_pos + 1)));

        if (!overwrite && std::getenv(key.c_str()) != nullptr) {
            continue;
        }
        if (setenv(key.c_str(), value.c_str(), 1) != 0) {
            return make_error<size_t>(ErrorCode::INVALID_DATA,
                                      "Failed to set environment variable: " + key, "EnvLoader");
        }
        ++loaded;
    }
    return Result<size_t>(loaded);
}

Result<std::string> EnvLoader::find(const std::string& start_dir, const std::string& filename) {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::absolute(start_dir, ec);
    if (ec) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT,
                                       "Invalid directory: " + start_dir, "EnvLoader");
    }

    while (true) {
        auto candidate = dir / filename;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return Result<std::string>(candidate.string());
        }
        if (!dir.has_parent_path() || dir.parent_path() == dir) {
            break;
        }
        dir = dir.parent_path();
    }
    return make_error<std::string>(ErrorCode::DATA_NOT_FOUND,
                                   "No " + filename + " found above " + start_dir, "EnvLoader");
}

}  // namespace trade_store
