#pragma once

#include <juce_core/juce_core.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace drover {

/**
 * @brief How a worker process terminated
 *
 * Exactly one of the two fields is normally set: a process that returned
 * from main (or called exit) has an exit code, a process killed by a signal
 * has the signal name (e.g. "SIGINT").
 */
struct ExitStatus {
    std::optional<int> exitCode;
    std::optional<std::string> signal;

    bool wasInterrupted() const {
        return signal.has_value() && *signal == "SIGINT";
    }
};

/**
 * @brief Handle to one live worker process
 */
class WorkerProcess {
  public:
    virtual ~WorkerProcess() = default;

    /**
     * @brief Operating system process id (or a fake id in tests)
     */
    virtual int getProcessId() const = 0;

    /**
     * @brief Deliver the interactive interrupt (SIGINT) to the worker
     * @throws std::runtime_error if the signal could not be delivered
     */
    virtual void interrupt() = 0;
};

/**
 * @brief Spawns worker processes and reports their termination
 *
 * The exit observer is called exactly once per successful launch, after the
 * child has terminated, on a thread owned by the launcher. The error observer
 * is called when a launch fails; no exit observer follows in that case.
 */
class WorkerLauncher {
  public:
    using ExitObserver = std::function<void(const ExitStatus& status)>;
    using ErrorObserver = std::function<void(const std::string& error)>;

    virtual ~WorkerLauncher() = default;

    /**
     * @brief Launch a worker
     * @param command Executable followed by its arguments
     * @param onExit Called once when the worker terminates
     * @param onError Called if the worker could not be started
     * @return The live worker, or nullptr if the launch failed
     */
    virtual std::unique_ptr<WorkerProcess> launch(const juce::StringArray& command,
                                                  ExitObserver onExit,
                                                  ErrorObserver onError) = 0;
};

/**
 * @brief Launcher backed by fork/execvp
 *
 * Children inherit the supervisor's stdin, stdout and stderr. A watcher
 * thread per child blocks in waitpid() and delivers the exit observer.
 */
class PosixWorkerLauncher : public WorkerLauncher {
  public:
    std::unique_ptr<WorkerProcess> launch(const juce::StringArray& command, ExitObserver onExit,
                                          ErrorObserver onError) override;

    /**
     * @brief Name of a signal as reported in ExitStatus ("SIGINT", "SIGTERM", ...)
     */
    static std::string signalName(int signalNumber);

  protected:
    /**
     * @brief Run @p watcher on a thread of its own
     * @return false if no thread could be started; the child is then killed
     *         and the launch fails
     */
    virtual bool startWatcher(std::function<void()> watcher);
};

}  // namespace drover
