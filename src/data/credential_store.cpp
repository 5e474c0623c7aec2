// src/data/credential_store.cpp
#include "option_screener/data/credential_store.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>

namespace option_screener {

namespace {
const std::regex NAME_PATTERN(R"(^[a-zA-Z0-9_]{1,64}$)");
const std::regex API_KEY_PATTERN(R"(^[a-zA-Z0-9]{8,128}$)");
}  // namespace

CredentialStore::CredentialStore(const std::string& path) : config_(nlohmann::json::object()),
                                                            config_path_(path) {
    const char* env_config = std::getenv("OPTION_SCREENER_CONFIG");
    if (env_config) {
        std::filesystem::path env_path(env_config);
        if (env_path.extension() == ".json" && env_path.string().length() < 512) {
            config_path_ = env_config;
        }
    }
}

CredentialStore::CredentialStore(nlohmann::json config) : config_(std::move(config)) {}

Result<void> CredentialStore::load_config() {
    if (!std::filesystem::exists(config_path_)) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND, "Config file not found: " + config_path_,
                                "CredentialStore");
    }

    std::ifstream config_file(config_path_);
    if (!config_file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open config file: " + config_path_, "CredentialStore");
    }

    try {
        nlohmann::json parsed;
        config_file >> parsed;
        config_ = std::move(parsed);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Failed to parse config file: " + std::string(e.what()),
                                "CredentialStore");
    }

    return Result<void>();
}

bool CredentialStore::has_credential(const std::string& section, const std::string& key) const {
    return config_.contains(section) && config_[section].is_object() &&
           config_[section].contains(key);
}

Result<std::string> CredentialStore::get_api_key(const std::string& section,
                                                 const std::string& env_var) const {
    std::string key;
    const char* env_value = env_var.empty() ? nullptr : std::getenv(env_var.c_str());
    if (env_value && *env_value) {
        key = env_value;
    } else {
        auto file_value = get<std::string>(section, "api_key");
        if (file_value.is_error()) {
            return make_error<std::string>(
                ErrorCode::INVALID_CONFIGURATION,
                "No API key for " + section + " (set " + env_var + " or " + section +
                    ".api_key)",
                "CredentialStore");
        }
        key = file_value.value();
    }

    if (!std::regex_match(key, API_KEY_PATTERN)) {
        return make_error<std::string>(ErrorCode::INVALID_CONFIGURATION,
                                       "Malformed API key for " + section, "CredentialStore");
    }
    return Result<std::string>(key);
}

Result<void> CredentialStore::validate_names(const std::string& section,
                                             const std::string& key) const {
    if (!std::regex_match(section, NAME_PATTERN) || !std::regex_match(key, NAME_PATTERN)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Invalid configuration name: " + section + "." + key,
                                "CredentialStore");
    }
    return Result<void>();
}

}  // namespace option_screener
