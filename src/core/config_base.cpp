#include "rebalancer/core/config_base.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace rebalancer {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    try {
        nlohmann::json j = to_json();
        std::ofstream file(filepath);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open file for writing: " + filepath, "ConfigBase");
        }
        file << std::setw(4) << j << std::endl;
        if (!file.good()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed to write file: " + filepath,
                                    "ConfigBase");
        }
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                                std::string("Error saving ") + filepath + ": " + e.what(),
                                "ConfigBase");
    }
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    if (!std::filesystem::exists(filepath)) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND, "File not found: " + filepath,
                                "ConfigBase");
    }

    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open file for reading: " + filepath, "ConfigBase");
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Failed to parse " + filepath + ": " + e.what(), "ConfigBase");
    }

    try {
        from_json(j);
    } catch (const RebalanceError& e) {
        return make_error<void>(e.code(), e.what(), "ConfigBase");
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Invalid document in " + filepath + ": " + e.what(),
                                "ConfigBase");
    }
    return Result<void>();
}

}  // namespace rebalancer
