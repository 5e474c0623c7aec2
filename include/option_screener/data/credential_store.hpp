// include/option_screener/data/credential_store.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "option_screener/core/error.hpp"

namespace option_screener {

/**
 * @brief Read-only store for provider API keys
 *
 * Keys live in the screener's JSON config under per-provider sections
 * ({"alpha_vantage": {"api_key": "..."}}). An environment variable, when set,
 * takes precedence over the file so keys never have to be written to disk.
 */
class CredentialStore {
public:
    /**
     * @param path Path to the JSON config; OPTION_SCREENER_CONFIG overrides it
     */
    explicit CredentialStore(const std::string& path = "config.json");

    /**
     * @brief Build a store from an already parsed document
     */
    explicit CredentialStore(nlohmann::json config);

    /**
     * @brief Load or reload configuration from file
     * @return FILE_NOT_FOUND or JSON_PARSE_ERROR on failure
     */
    Result<void> load_config();

    const std::string& config_path() const {
        return config_path_;
    }

    template <typename T>
    Result<T> get(const std::string& section, const std::string& key) const;

    template <typename T>
    T get_with_default(const std::string& section, const std::string& key,
                       const T& default_value) const;

    bool has_credential(const std::string& section, const std::string& key) const;

    /**
     * @brief Resolve an API key, environment first, then config file
     * @param section Provider section in the config
     * @param env_var Environment variable checked first
     * @return Key, or INVALID_CONFIGURATION when absent or malformed
     */
    Result<std::string> get_api_key(const std::string& section, const std::string& env_var) const;

private:
    Result<void> validate_names(const std::string& section, const std::string& key) const;

    nlohmann::json config_;
    std::string config_path_;
};

template <typename T>
Result<T> CredentialStore::get(const std::string& section, const std::string& key) const {
    auto name_validation = validate_names(section, key);
    if (name_validation.is_error()) {
        return make_error<T>(name_validation.error()->code(), name_validation.error()->what(),
                             "CredentialStore");
    }

    if (!config_.contains(section) || !config_[section].is_object() ||
        !config_[section].contains(key)) {
        return make_error<T>(ErrorCode::INVALID_CONFIGURATION,
                             "Configuration not found: " + section + "." + key, "CredentialStore");
    }

    try {
        return Result<T>(config_[section][key].get<T>());
    } catch (const std::exception& e) {
        return make_error<T>(ErrorCode::CONVERSION_ERROR,
                             "Failed to convert configuration value: " + std::string(e.what()),
                             "CredentialStore");
    }
}

template <typename T>
T CredentialStore::get_with_default(const std::string& section, const std::string& key,
                                    const T& default_value) const {
    auto result = get<T>(section, key);
    return result.is_error() ? default_value : result.value();
}

}  // namespace option_screener
