#include "service_control.hpp"
#include <format>

ComposeServiceController::ComposeServiceController(fs::path projectDir, std::string service,
                                                   std::chrono::seconds timeout)
    : projectDir_(std::move(projectDir)), service_(std::move(service)), timeout_(timeout) {}

std::vector<std::string> ComposeServiceController::compose(std::initializer_list<std::string> args) const {
    std::vector<std::string> argv = {"docker", "compose", "--project-directory", projectDir_.string()};
    argv.insert(argv.end(), args.begin(), args.end());
    if (!service_.empty()) {
        argv.push_back(service_);
    }
    return argv;
}

std::expected<void, std::string> ComposeServiceController::stop() {
    ProcessOptions options;
    options.timeout = timeout_;
    auto result = runner_.run(compose({"stop"}), options);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!result->ok()) {
        return std::unexpected(std::format("docker compose stop failed: {}", result->describe()));
    }
    return {};
}

std::expected<void, std::string> ComposeServiceController::start() {
    ProcessOptions options;
    options.timeout = timeout_;
    auto result = runner_.run(compose({"up", "-d"}), options);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!result->ok()) {
        return std::unexpected(std::format("docker compose up failed: {}", result->describe()));
    }
    return {};
}

bool ComposeServiceController::isRunning() const {
    ProcessOptions options;
    options.timeout = std::chrono::seconds(30);
    auto result = runner_.run(compose({"ps", "--status", "running", "-q"}), options);
    if (!result || !result->ok()) {
        // Unknown state counts as running so nothing is written.
        return true;
    }
    return result->output.find_first_not_of(" \t\r\n") != std::string::npos;
}

DockerHealthProbe::DockerHealthProbe(std::vector<std::string> containers) : containers_(std::move(containers)) {}

bool DockerHealthProbe::isHealthy() const {
    ProcessOptions options;
    options.timeout = std::chrono::seconds(30);
    for (const auto& container : containers_) {
        auto result = runner_.run({"docker", "inspect", "--format",
                                   "{{.State.Status}} {{if .State.Health}}{{.State.Health.Status}}{{else}}none{{end}}",
                                   container},
                                  options);
        if (!result || !result->ok()) {
            return false;
        }
        std::string state = result->output;
        while (!state.empty() && (state.back() == '\n' || state.back() == '\r' || state.back() == ' ')) {
            state.pop_back();
        }
        if (state != "running healthy" && state != "running none") {
            return false;
        }
    }
    return true;
}
