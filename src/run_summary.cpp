#include "run_summary.hpp"
#include <format>
#include <sstream>

const char* toString(FailureCategory category) {
    switch (category) {
        case FailureCategory::Configuration: return "configuration";
        case FailureCategory::Artifact:      return "artifact";
        case FailureCategory::Verification:  return "verification";
        case FailureCategory::Restore:       return "restore";
        case FailureCategory::Resource:      return "resource";
    }
    return "unknown";
}

RunSummary::RunSummary(std::string operation) : operation_(std::move(operation)) {}

void RunSummary::succeeded(const std::string& component, const std::string& detail) {
    successes_.emplace_back(component, detail);
}

void RunSummary::warned(const std::string& component, FailureCategory category, const std::string& detail) {
    warnings_.push_back({component, category, detail});
}

void RunSummary::failed(const std::string& component, FailureCategory category, const std::string& detail) {
    failures_.push_back({component, category, detail});
}

void RunSummary::fatal(FailureCategory category, const std::string& detail) {
    fatal_ = true;
    fatalCategory_ = category;
    fatalDetail_ = detail;
}

ExitCode RunSummary::exitCode() const {
    if (fatal_) {
        return fatalCategory_ == FailureCategory::Configuration ? ExitCode::Configuration : ExitCode::Fatal;
    }
    return isDegraded() ? ExitCode::Degraded : ExitCode::Success;
}

std::string RunSummary::render() const {
    std::ostringstream out;
    const char* status = fatal_ ? "FAILED" : (isDegraded() ? "DEGRADED" : "SUCCESS");
    out << std::format("==== {} summary: {} ====\n", operation_, status);
    for (const auto& [component, detail] : successes_) {
        out << "  [ OK ] " << component;
        if (!detail.empty()) {
            out << " (" << detail << ")";
        }
        out << '\n';
    }
    for (const auto& entry : warnings_) {
        out << std::format("  [WARN] {} [{}]: {}\n", entry.component, toString(entry.category), entry.detail);
    }
    for (const auto& entry : failures_) {
        out << std::format("  [FAIL] {} [{}]: {}\n", entry.component, toString(entry.category), entry.detail);
    }
    if (fatal_) {
        out << std::format("  Fatal [{}]: {}\n", toString(fatalCategory_), fatalDetail_);
    }
    out << std::format("  Exit code: {}\n", static_cast<int>(exitCode()));
    return out.str();
}
