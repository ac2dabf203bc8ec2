#include "secret_source.hpp"
#include <cstdlib>

EnvironmentSecretSource::EnvironmentSecretSource(std::string prefix) : prefix_(std::move(prefix)) {}

std::optional<std::string> EnvironmentSecretSource::lookup(const std::string& key) const {
    const char* value = std::getenv((prefix_ + key).c_str());
    if (!value || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

JsonSecretSource::JsonSecretSource(Json::Value settings) : settings_(std::move(settings)) {}

std::optional<std::string> JsonSecretSource::lookup(const std::string& key) const {
    if (!settings_.isObject() || !settings_.isMember(key)) {
        return std::nullopt;
    }
    const Json::Value& value = settings_[key];
    if (!value.isString() || value.asString().empty()) {
        return std::nullopt;
    }
    return value.asString();
}

void SecretChain::add(std::unique_ptr<SecretSource> source) {
    if (source) {
        sources_.push_back(std::move(source));
    }
}

std::optional<std::string> SecretChain::lookup(const std::string& key) const {
    for (const auto& source : sources_) {
        if (auto value = source->lookup(key)) {
            return value;
        }
    }
    return std::nullopt;
}

std::string SecretChain::name() const {
    std::string joined;
    for (const auto& source : sources_) {
        if (!joined.empty()) {
            joined += " -> ";
        }
        joined += source->name();
    }
    return joined.empty() ? "empty chain" : joined;
}

std::optional<std::string> SecretChain::resolvedBy(const std::string& key) const {
    for (const auto& source : sources_) {
        if (source->lookup(key)) {
            return source->name();
        }
    }
    return std::nullopt;
}
