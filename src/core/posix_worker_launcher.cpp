#include "drover/core/worker_launcher.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace drover {

namespace {

class PosixWorkerProcess : public WorkerProcess {
  public:
    explicit PosixWorkerProcess(pid_t pid) : pid_(pid) {}

    int getProcessId() const override {
        return static_cast<int>(pid_);
    }

    void interrupt() override {
        if (::kill(pid_, SIGINT) != 0) {
            throw std::runtime_error("Failed to send SIGINT to process " + std::to_string(pid_) +
                                     ": " + std::strerror(errno));
        }
    }

  private:
    pid_t pid_;
};

ExitStatus decodeWaitStatus(int status) {
    ExitStatus result;
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = PosixWorkerLauncher::signalName(WTERMSIG(status));
    }
    return result;
}

}  // namespace

std::string PosixWorkerLauncher::signalName(int signalNumber) {
    switch (signalNumber) {
        case SIGHUP:
            return "SIGHUP";
        case SIGINT:
            return "SIGINT";
        case SIGQUIT:
            return "SIGQUIT";
        case SIGILL:
            return "SIGILL";
        case SIGABRT:
            return "SIGABRT";
        case SIGBUS:
            return "SIGBUS";
        case SIGFPE:
            return "SIGFPE";
        case SIGKILL:
            return "SIGKILL";
        case SIGUSR1:
            return "SIGUSR1";
        case SIGSEGV:
            return "SIGSEGV";
        case SIGUSR2:
            return "SIGUSR2";
        case SIGPIPE:
            return "SIGPIPE";
        case SIGALRM:
            return "SIGALRM";
        case SIGTERM:
            return "SIGTERM";
        default:
            return "SIG" + std::to_string(signalNumber);
    }
}

bool PosixWorkerLauncher::startWatcher(std::function<void()> watcher) {
    return juce::Thread::launch(std::move(watcher));
}

std::unique_ptr<WorkerProcess> PosixWorkerLauncher::launch(const juce::StringArray& command,
                                                           ExitObserver onExit,
                                                           ErrorObserver onError) {
    if (command.isEmpty()) {
        if (onError)
            onError("No worker command configured");
        return nullptr;
    }

    // Everything the child touches is prepared before fork()
    std::vector<std::string> argStorage;
    argStorage.reserve(static_cast<size_t>(command.size()));
    for (const auto& arg : command)
        argStorage.push_back(arg.toStdString());

    std::vector<char*> argv;
    argv.reserve(argStorage.size() + 1);
    for (auto& arg : argStorage)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // The child reports an exec failure through this pipe; a successful exec
    // closes it without writing.
    int errorPipe[2];
    if (::pipe2(errorPipe, O_CLOEXEC) != 0) {
        if (onError)
            onError(std::string("pipe2 failed: ") + std::strerror(errno));
        return nullptr;
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int forkError = errno;
        ::close(errorPipe[0]);
        ::close(errorPipe[1]);
        if (onError)
            onError(std::string("fork failed: ") + std::strerror(forkError));
        return nullptr;
    }

    if (pid == 0) {
        ::close(errorPipe[0]);
        ::execvp(argv[0], argv.data());
        const int execError = errno;
        [[maybe_unused]] auto written = ::write(errorPipe[1], &execError, sizeof(execError));
        ::_exit(127);
    }

    ::close(errorPipe[1]);

    int childError = 0;
    ssize_t bytesRead;
    do {
        bytesRead = ::read(errorPipe[0], &childError, sizeof(childError));
    } while (bytesRead < 0 && errno == EINTR);
    ::close(errorPipe[0]);

    if (bytesRead > 0) {
        int ignored = 0;
        while (::waitpid(pid, &ignored, 0) < 0 && errno == EINTR) {
        }
        if (onError)
            onError("Failed to execute " + argStorage.front() + ": " + std::strerror(childError));
        return nullptr;
    }

    const bool watching = startWatcher([pid, onExit]() {
        int status = 0;
        pid_t result;
        do {
            result = ::waitpid(pid, &status, 0);
        } while (result < 0 && errno == EINTR);

        ExitStatus exitStatus;
        if (result == pid) {
            exitStatus = decodeWaitStatus(status);
        } else {
            juce::Logger::writeToLog("ERROR: waitpid failed for process " + juce::String(pid) +
                                     ": " + std::strerror(errno));
        }

        if (onExit)
            onExit(exitStatus);
    });

    if (!watching) {
        // An unwatched child would never be reaped or reported
        ::kill(pid, SIGKILL);
        int ignored = 0;
        while (::waitpid(pid, &ignored, 0) < 0 && errno == EINTR) {
        }
        if (onError)
            onError("Could not start a watcher thread for process " + std::to_string(pid));
        return nullptr;
    }

    return std::make_unique<PosixWorkerProcess>(pid);
}

}  // namespace drover
