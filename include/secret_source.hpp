/**
 * @file secret_source.hpp
 * @brief Lookup chain for externally supplied secrets.
 *
 * VaultKeeper never generates, rotates or stores secrets. It only reads them from
 * the sources configured by the deployment: the process environment first, then
 * the settings file. Vault-backed providers plug in through the same interface.
 */

#ifndef SECRET_SOURCE_HPP
#define SECRET_SOURCE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

/**
 * @brief Interface for a single secret provider.
 */
class SecretSource {
public:
    virtual ~SecretSource() = default;

    /**
     * @brief Looks up a secret by key.
     *
     * @param key Configuration key (e.g. "BACKUP_PASSPHRASE").
     * @return std::optional<std::string> The value, or std::nullopt if this source has none.
     */
    virtual std::optional<std::string> lookup(const std::string& key) const = 0;

    /**
     * @brief Human-readable name used in log lines ("environment", "settings file").
     */
    virtual std::string name() const = 0;
};

/**
 * @brief Reads secrets from environment variables named <prefix><key>.
 */
class EnvironmentSecretSource : public SecretSource {
public:
    explicit EnvironmentSecretSource(std::string prefix = "VAULTKEEPER_");

    std::optional<std::string> lookup(const std::string& key) const override;
    std::string name() const override { return "environment"; }

private:
    std::string prefix_; ///< Variable name prefix.
};

/**
 * @brief Reads secrets from a parsed settings document.
 */
class JsonSecretSource : public SecretSource {
public:
    explicit JsonSecretSource(Json::Value settings);

    std::optional<std::string> lookup(const std::string& key) const override;
    std::string name() const override { return "settings file"; }

private:
    Json::Value settings_; ///< Parsed settings document.
};

/**
 * @brief Ordered fallback chain over several sources; the first non-empty value wins.
 */
class SecretChain : public SecretSource {
public:
    void add(std::unique_ptr<SecretSource> source);

    std::optional<std::string> lookup(const std::string& key) const override;
    std::string name() const override;

    /**
     * @brief Name of the source that would answer @p key, for logging.
     */
    std::optional<std::string> resolvedBy(const std::string& key) const;

private:
    std::vector<std::unique_ptr<SecretSource>> sources_;
};

#endif // SECRET_SOURCE_HPP
