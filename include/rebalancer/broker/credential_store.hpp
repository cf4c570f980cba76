// include/rebalancer/broker/credential_store.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "rebalancer/core/error.hpp"

namespace rebalancer {

/**
 * @brief Read-only store of API credentials
 *
 * Values come from environment variables first and otherwise from a JSON file of
 * sections, e.g. {"alpaca": {"api_key_id": "...", "api_secret_key": "..."}}.
 * The file path may be overridden with REBALANCER_CREDENTIALS_PATH.
 */
class CredentialStore {
public:
    explicit CredentialStore(const std::string& path = "credentials.json");

    /**
     * @brief Load or reload the credential file
     * @return FILE_NOT_FOUND when absent, JSON_PARSE_ERROR when malformed
     */
    Result<void> load_config();

    const std::string& path() const {
        return config_path_;
    }

    /**
     * @brief Credential value, preferring the environment variable when set
     * @param section File section
     * @param key Key inside the section
     * @param env_var Environment variable consulted first; ignored when empty
     */
    Result<std::string> get_credential(const std::string& section, const std::string& key,
                                       const std::string& env_var = "") const;

    bool has_credential(const std::string& section, const std::string& key) const;

    template <typename T>
    Result<T> get(const std::string& section, const std::string& key) const;

private:
    nlohmann::json config_;
    std::string config_path_;
};

template <typename T>
Result<T> CredentialStore::get(const std::string& section, const std::string& key) const {
    if (!has_credential(section, key)) {
        return make_error<T>(ErrorCode::INVALID_ARGUMENT,
                             "Credential not found: " + section + "." + key, "CredentialStore");
    }

    try {
        return Result<T>(config_.at(section).at(key).get<T>());
    } catch (const nlohmann::json::exception& e) {
        return make_error<T>(ErrorCode::CONVERSION_ERROR,
                             "Failed to convert credential " + section + "." + key + ": " +
                                 e.what(),
                             "CredentialStore");
    }
}

}  // namespace rebalancer
