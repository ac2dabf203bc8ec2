#include "retention.hpp"
#include <format>

RetentionManager::RetentionManager(const Logger& logger) : logger_(logger) {}

std::expected<PruneResult, std::string> RetentionManager::prune(const BackupCatalog& catalog, int keepCount,
                                                                const std::string& protectedId) const {
    auto entries = catalog.list();
    PruneResult result;
    result.remaining = entries.size();

    if (keepCount <= 0) {
        logger_.debug(std::format("Retention disabled for {} sets", toString(catalog.category())));
        return result;
    }
    if (entries.size() <= static_cast<size_t>(keepCount)) {
        logger_.debug(std::format("{} {} sets on disk, keeping all (limit {})", entries.size(),
                                  toString(catalog.category()), keepCount));
        return result;
    }

    size_t excess = entries.size() - static_cast<size_t>(keepCount);
    for (const auto& entry : entries) {
        if (excess == 0) {
            break;
        }
        if (entry.id == protectedId) {
            continue;
        }
        std::error_code ec;
        fs::remove_all(entry.directory, ec);
        if (ec) {
            return std::unexpected(std::format("Failed to remove backup set {}: {}", entry.id, ec.message()));
        }
        logger_.info(std::format("Removed old {} backup set: {}", toString(catalog.category()), entry.id));
        result.removed.push_back(entry.id);
        --result.remaining;
        --excess;
    }
    return result;
}
