// include/rebalancer/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "rebalancer/core/error.hpp"

namespace rebalancer {

/**
 * @brief Base class for JSON-backed documents (configuration and checkpoints)
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Save to a JSON file
     * @param filepath Path to save the file
     * @return Result indicating success or failure
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Load from a JSON file
     * @param filepath Path to the file
     * @return Result indicating success or failure
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Load from JSON
     * Implementations may throw on malformed documents; load_from_file turns
     * that into an error result.
     */
    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace rebalancer
