#include "rebalancer/broker/credential_store.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace rebalancer {

CredentialStore::CredentialStore(const std::string& path)
    : config_(nlohmann::json::object()), config_path_(path) {
    const char* env_path = std::getenv("REBALANCER_CREDENTIALS_PATH");
    if (env_path && *env_path) {
        config_path_ = env_path;
    }
}

Result<void> CredentialStore::load_config() {
    if (!std::filesystem::exists(config_path_)) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "Credential file not found: " + config_path_, "CredentialStore");
    }

    std::error_code ec;
    auto perms = std::filesystem::status(config_path_, ec).permissions();
    if (!ec && (perms & std::filesystem::perms::others_read) != std::filesystem::perms::none) {
        std::cerr << "Warning: Credential file is world-readable: " << config_path_ << std::endl;
    }

    std::ifstream file(config_path_);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open credential file: " + config_path_,
                                "CredentialStore");
    }

    nlohmann::json loaded;
    try {
        file >> loaded;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Failed to parse credential file: " + std::string(e.what()),
                                "CredentialStore");
    }
    if (!loaded.is_object()) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Credential file must contain a JSON object", "CredentialStore");
    }

    config_ = std::move(loaded);
    return Result<void>();
}

bool CredentialStore::has_credential(const std::string& section, const std::string& key) const {
    return config_.contains(section) && config_.at(section).is_object() &&
           config_.at(section).contains(key);
}

Result<std::string> CredentialStore::get_credential(const std::string& section,
                                                    const std::string& key,
                                                    const std::string& env_var) const {
    if (!env_var.empty()) {
        const char* value = std::getenv(env_var.c_str());
        if (value && *value) {
            return Result<std::string>(std::string(value));
        }
    }

    auto stored = get<std::string>(section, key);
    if (stored.is_error()) {
        std::string hint = env_var.empty() ? "" : " (set " + env_var + " or add it to " +
                                                      config_path_ + ")";
        return make_error<std::string>(stored.error()->code(), stored.error()->what() + hint,
                                       "CredentialStore");
    }
    if (stored.value().empty()) {
        return make_error<std::string>(ErrorCode::INVALID_DATA,
                                       "Credential " + section + "." + key + " is empty",
                                       "CredentialStore");
    }
    return Result<std::string>(stored.value());
}

}  // namespace rebalancer
