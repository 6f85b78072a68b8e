#pragma once

#include "drover/core/agent_supervisor.hpp"
#include "drover/core/fleet_registry.hpp"
#include "drover/core/main_proxy.hpp"
#include "drover/core/settings.hpp"
#include "drover/net/status_server.hpp"

#include <juce_core/juce_core.h>

#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace drover {

/**
 * @brief Options taken from the command line
 */
struct LaunchOptions {
    std::vector<std::string> profiles;
    std::optional<std::string> taskPath;
    std::optional<std::string> taskId;
    std::optional<std::string> settingsFile;
    bool showHelp = false;
};

/**
 * @brief Top-level orchestrator
 *
 * Owns the fleet, the registration service and the optional status server.
 * Starts one supervisor per profile, then hands control to the console.
 */
class DroverApp {
  public:
    /**
     * @param settings Configuration to run with
     * @param launcher Launcher used by every supervisor
     * @param onFatalExit Called when a worker fails fatally; defaults to
     *        stopping the fleet and ending the process with the code. Runs on
     *        a watcher thread and must not call shutdown().
     */
    DroverApp(Settings& settings, WorkerLauncher& launcher,
              AgentSupervisor::FatalExitHandler onFatalExit = {});

    ~DroverApp();

    DroverApp(const DroverApp&) = delete;
    DroverApp& operator=(const DroverApp&) = delete;

    /**
     * @brief Parse the process arguments
     * @throws std::invalid_argument on unknown options or missing values
     */
    static LaunchOptions parseArguments(const juce::ArgumentList& args);

    static void printUsage(std::ostream& out);

    /**
     * @brief Start up, run the console and shut down
     * @return The process exit code
     */
    int run(const LaunchOptions& options, std::istream& in, std::ostream& out);

    /**
     * @brief Load each profile and start a supervised agent for it
     *
     * Unreadable, invalid and duplicate profiles are reported and skipped.
     * @return Number of agents registered
     */
    size_t startAgents(const std::vector<std::string>& profiles, const LaunchOptions& options);

    /**
     * @brief Detach every supervisor, then stop all agents and the status server
     *
     * Must not be called from the fatal exit handler.
     */
    void shutdown();

    FleetRegistry& getFleet() {
        return fleet_;
    }
    MainProxy& getProxy() {
        return *proxy_;
    }
    StatusServer* getStatusServer() {
        return statusServer_.get();
    }

  private:
    AgentSupervisor::Environment makeEnvironment();
    void stopServices();
    void terminate(int exitCode);

    Settings& settings_;
    WorkerLauncher& launcher_;
    AgentSupervisor::FatalExitHandler onFatalExit_;

    std::unique_ptr<StatusServer> statusServer_;
    std::unique_ptr<MainProxy> proxy_;
    FleetRegistry fleet_;
};

}  // namespace drover
