/**
 * @file run_summary.hpp
 * @brief End-of-run report and exit code policy shared by the VaultKeeper tools.
 *
 * Components record their outcome by name; the summary decides whether the run
 * was a full success, degraded, or fatal and renders the human-readable report
 * printed at the end of every run.
 */

#ifndef RUN_SUMMARY_HPP
#define RUN_SUMMARY_HPP

#include <string>
#include <vector>

/**
 * @brief Process exit codes.
 */
enum class ExitCode : int {
    Success = 0,       ///< Everything succeeded.
    Fatal = 1,         ///< Unrecoverable failure.
    Configuration = 2, ///< Configuration or usage error, nothing was touched.
    Degraded = 3       ///< Run completed but some components or verifications failed.
};

/**
 * @brief Error taxonomy used in logs and summaries.
 */
enum class FailureCategory {
    Configuration,
    Artifact,
    Verification,
    Restore,
    Resource
};

const char* toString(FailureCategory category);

class RunSummary {
public:
    explicit RunSummary(std::string operation);

    void succeeded(const std::string& component, const std::string& detail = {});
    void warned(const std::string& component, FailureCategory category, const std::string& detail);
    void failed(const std::string& component, FailureCategory category, const std::string& detail);

    /**
     * @brief Marks the whole run as fatal (e.g. native format failed, restore aborted).
     */
    void fatal(FailureCategory category, const std::string& detail);

    bool isFatal() const { return fatal_; }
    bool isDegraded() const { return !failures_.empty() || !warnings_.empty(); }
    ExitCode exitCode() const;

    /**
     * @brief Multi-line report listing succeeded and failed components by name.
     */
    std::string render() const;

private:
    struct Entry {
        std::string component;
        FailureCategory category;
        std::string detail;
    };

    std::string operation_;
    std::vector<std::pair<std::string, std::string>> successes_;
    std::vector<Entry> warnings_;
    std::vector<Entry> failures_;
    bool fatal_ = false;
    FailureCategory fatalCategory_ = FailureCategory::Artifact;
    std::string fatalDetail_;
};

#endif // RUN_SUMMARY_HPP
