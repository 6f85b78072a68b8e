#pragma once

#include "agent_descriptor.hpp"
#include "registration_service.hpp"
#include "worker_launcher.hpp"

#include <juce_core/juce_core.h>

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace drover {

/**
 * @brief Owns the lifecycle of one named agent
 *
 * Idle -> Running on start(), Running -> Idle on worker exit or stop(),
 * and back to Running on automatic restart or resume().
 *
 * A worker that exits with a code other than 0 and was not interrupted is
 * restarted, unless it ran for less than the restart guard window, in which
 * case supervision is abandoned until an operator calls resume(). An exit
 * code greater than 1 is fatal for the whole program.
 *
 * Always create supervisors through create(); observers hold weak
 * references to the supervisor.
 */
class AgentSupervisor : public std::enable_shared_from_this<AgentSupervisor> {
  public:
    using Clock = std::function<juce::int64()>;
    using FatalExitHandler = std::function<void(int exitCode)>;

    static constexpr juce::int64 defaultRestartGuardMs = 10000;
    static constexpr const char* restartAnnouncement = "Agent process restarted.";

    /**
     * @brief Collaborators shared by every supervisor of a fleet
     */
    struct Environment {
        WorkerLauncher* launcher = nullptr;
        RegistrationService* registration = nullptr;
        juce::StringArray workerCommand;
        Clock clock;
        FatalExitHandler onFatalExit;
        juce::int64 restartGuardMs = defaultRestartGuardMs;
    };

    static std::shared_ptr<AgentSupervisor> create(AgentDescriptor descriptor,
                                                   Environment environment);

    ~AgentSupervisor();

    AgentSupervisor(const AgentSupervisor&) = delete;
    AgentSupervisor& operator=(const AgentSupervisor&) = delete;

    const std::string& getName() const {
        return descriptor_.name;
    }
    const AgentDescriptor& getDescriptor() const {
        return descriptor_;
    }

    /**
     * @brief Spawn the worker
     * @param isResuming Passed to the worker as its load-memory flag
     * @param announceMessage Passed to the worker with -m; defaults to the
     *        descriptor's initial message
     * @return false if the agent is already running or the launch failed
     */
    bool start(bool isResuming = false,
               const std::optional<std::string>& announceMessage = std::nullopt);

    /**
     * @brief Interrupt the worker; does nothing if it is not running
     */
    void stop();

    /**
     * @brief Start the worker again after a stop or an abandoned restart
     *
     * Not subject to the restart guard.
     * @return false if the launch failed; true if the worker is running
     */
    bool resume();

    /**
     * @brief Cut the supervisor off from its registration service and fatal
     *        exit handler
     *
     * Later worker exits are logged only: no logout, no fatal exit and no
     * restart. Blocks until exit callbacks already in progress on other
     * threads have returned, so the collaborators can be destroyed
     * afterwards. Must not be called from the fatal exit handler.
     */
    void detach();

    /**
     * @brief Relay an outbound message on behalf of the agent
     */
    std::future<void> relayMessage(const std::string& text);

    bool isRunning() const;

    /**
     * @brief Time of the most recent spawn according to the supervisor clock
     */
    juce::int64 getLastRestartTime() const;

    /**
     * @brief Process id of the live worker, or -1
     */
    int getProcessId() const;

  private:
    AgentSupervisor(AgentDescriptor descriptor, Environment environment);

    bool spawnLocked(bool isResuming, const std::optional<std::string>& announceMessage);
    void handleExit(juce::uint64 generation, const ExitStatus& status);
    void handleError(const std::string& error);
    void endCallback();

    const AgentDescriptor descriptor_;
    Environment env_;

    mutable std::mutex mutex_;
    bool running_ = false;
    bool stopRequested_ = false;
    bool detached_ = false;
    int callbacksInFlight_ = 0;
    std::condition_variable callbacksDone_;
    juce::int64 lastRestart_ = 0;
    juce::uint64 generation_ = 0;
    std::unique_ptr<WorkerProcess> process_;
};

}  // namespace drover
