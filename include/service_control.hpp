/**
 * @file service_control.hpp
 * @brief Quiesce/resume of the consuming service and its health probe.
 */

#ifndef SERVICE_CONTROL_HPP
#define SERVICE_CONTROL_HPP

#include <chrono>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>
#include "process_runner.hpp"

namespace fs = std::filesystem;

/**
 * @brief Stops and starts the service that holds the live data open.
 */
class ServiceController {
public:
    virtual ~ServiceController() = default;

    virtual std::expected<void, std::string> stop() = 0;
    virtual std::expected<void, std::string> start() = 0;
    virtual bool isRunning() const = 0;
};

/**
 * @brief Boolean "is the service healthy" probe shared with the external monitor.
 */
class HealthProbe {
public:
    virtual ~HealthProbe() = default;

    virtual bool isHealthy() const = 0;
};

/**
 * @brief Controls one or all services of a Docker Compose project.
 */
class ComposeServiceController : public ServiceController {
public:
    /**
     * @param projectDir Directory holding docker-compose.yml.
     * @param service Service to stop; empty means the whole project.
     * @param timeout Limit for one compose command.
     */
    ComposeServiceController(fs::path projectDir, std::string service, std::chrono::seconds timeout);

    std::expected<void, std::string> stop() override;
    std::expected<void, std::string> start() override;
    bool isRunning() const override;

private:
    std::vector<std::string> compose(std::initializer_list<std::string> args) const;

    fs::path projectDir_;
    std::string service_;
    std::chrono::seconds timeout_;
    ProcessRunner runner_;
};

/**
 * @brief Healthy when every listed container is running and its health status
 *        (if it defines a health check) is "healthy".
 */
class DockerHealthProbe : public HealthProbe {
public:
    explicit DockerHealthProbe(std::vector<std::string> containers);

    bool isHealthy() const override;

private:
    std::vector<std::string> containers_;
    ProcessRunner runner_;
};

#endif // SERVICE_CONTROL_HPP
