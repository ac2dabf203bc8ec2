/**
 * @file retention.hpp
 * @brief Keep-count pruning of backup sets per category.
 */

#ifndef RETENTION_HPP
#define RETENTION_HPP

#include <expected>
#include <string>
#include <vector>
#include "backup_set.hpp"
#include "logger.hpp"

/**
 * @brief Outcome of one pruning pass.
 */
struct PruneResult {
    std::vector<std::string> removed; ///< Set ids deleted, oldest first.
    size_t remaining = 0;             ///< Sets left on disk.
};

class RetentionManager {
public:
    explicit RetentionManager(const Logger& logger);

    /**
     * @brief Deletes the oldest sets until at most @p keepCount remain.
     *
     * Verified and unverified sets are treated alike. A @p keepCount of 0 disables
     * pruning. The set named @p protectedId is never removed.
     *
     * @return std::expected<PruneResult, std::string> What was removed, or the first deletion error.
     */
    std::expected<PruneResult, std::string> prune(const BackupCatalog& catalog, int keepCount,
                                                  const std::string& protectedId = {}) const;

private:
    const Logger& logger_;
};

#endif // RETENTION_HPP
