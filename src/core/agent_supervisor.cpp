#include "drover/core/agent_supervisor.hpp"

#include <stdexcept>

namespace drover {

namespace {

juce::String describe(const ExitStatus& status) {
    return "exited with code " +
           (status.exitCode ? juce::String(*status.exitCode) : juce::String("null")) +
           " and signal " + (status.signal ? juce::String(*status.signal) : juce::String("null"));
}

}  // namespace

std::shared_ptr<AgentSupervisor> AgentSupervisor::create(AgentDescriptor descriptor,
                                                         Environment environment) {
    // Private constructor, so no make_shared
    return std::shared_ptr<AgentSupervisor>(
        new AgentSupervisor(std::move(descriptor), std::move(environment)));
}

AgentSupervisor::AgentSupervisor(AgentDescriptor descriptor, Environment environment)
    : descriptor_(std::move(descriptor)), env_(std::move(environment)) {
    if (env_.launcher == nullptr)
        throw std::invalid_argument("AgentSupervisor needs a worker launcher");

    if (!env_.clock)
        env_.clock = [] { return juce::Time::currentTimeMillis(); };
}

AgentSupervisor::~AgentSupervisor() {
    stop();
}

bool AgentSupervisor::start(bool isResuming, const std::optional<std::string>& announceMessage) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (running_) {
        juce::Logger::writeToLog("Agent process (" + juce::String(descriptor_.name) +
                                 ") is already running");
        return false;
    }

    return spawnLocked(isResuming, announceMessage ? announceMessage : descriptor_.initMessage);
}

bool AgentSupervisor::spawnLocked(bool isResuming,
                                  const std::optional<std::string>& announceMessage) {
    auto command = env_.workerCommand;
    command.addArray(
        buildWorkerArguments(descriptor_, isResuming || descriptor_.loadMemory, announceMessage));

    const auto generation = ++generation_;
    std::weak_ptr<AgentSupervisor> weakThis = weak_from_this();

    auto process = env_.launcher->launch(
        command,
        [weakThis, generation](const ExitStatus& status) {
            if (auto self = weakThis.lock())
                self->handleExit(generation, status);
        },
        [weakThis](const std::string& error) {
            if (auto self = weakThis.lock())
                self->handleError(error);
        });

    if (!process)
        return false;

    process_ = std::move(process);
    running_ = true;
    stopRequested_ = false;
    lastRestart_ = env_.clock();

    juce::Logger::writeToLog("Agent process (" + juce::String(descriptor_.name) +
                             ") started with pid " + juce::String(process_->getProcessId()));
    return true;
}

void AgentSupervisor::handleExit(juce::uint64 generation, const ExitStatus& status) {
    juce::Logger::writeToLog("Agent process (" + juce::String(descriptor_.name) + ") " +
                             describe(status));

    RegistrationService* registration = nullptr;
    FatalExitHandler onFatalExit;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation == generation_) {
            running_ = false;
            process_.reset();
        }

        if (detached_)
            return;

        registration = env_.registration;
        onFatalExit = env_.onFatalExit;
        ++callbacksInFlight_;
    }

    // detach() waits for this scope to end
    struct CallbackScope {
        AgentSupervisor& supervisor;
        ~CallbackScope() {
            supervisor.endCallback();
        }
    } scope{*this};

    if (registration != nullptr)
        registration->logoutAgent(descriptor_.name);

    if (status.exitCode && *status.exitCode > 1) {
        juce::Logger::writeToLog("Ending task");
        if (onFatalExit)
            onFatalExit(*status.exitCode);
        return;
    }

    if (status.exitCode == 0 || status.wasInterrupted())
        return;

    std::lock_guard<std::mutex> lock(mutex_);

    // A newer spawn, an operator stop, or a manual resume already decided
    // what happens to this agent.
    if (detached_ || generation != generation_ || stopRequested_ || running_)
        return;

    if (env_.clock() - lastRestart_ < env_.restartGuardMs) {
        juce::Logger::writeToLog("ERROR: Agent process " + juce::String(descriptor_.profilePath) +
                                 " exited too quickly and will not be restarted.");
        return;
    }

    juce::Logger::writeToLog("Restarting agent...");
    if (!spawnLocked(true, std::string(restartAnnouncement))) {
        juce::Logger::writeToLog("ERROR: Restart of agent process (" +
                                 juce::String(descriptor_.name) + ") failed");
    }
}

void AgentSupervisor::endCallback() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --callbacksInFlight_;
    }
    callbacksDone_.notify_all();
}

void AgentSupervisor::detach() {
    std::unique_lock<std::mutex> lock(mutex_);

    detached_ = true;
    env_.registration = nullptr;
    env_.onFatalExit = nullptr;

    callbacksDone_.wait(lock, [this] { return callbacksInFlight_ == 0; });
}

void AgentSupervisor::handleError(const std::string& error) {
    juce::Logger::writeToLog("ERROR: Agent process (" + juce::String(descriptor_.name) +
                             ") error: " + juce::String(error));
}

void AgentSupervisor::stop() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!running_ || !process_)
        return;

    stopRequested_ = true;
    try {
        process_->interrupt();
    } catch (const std::exception& e) {
        juce::Logger::writeToLog("ERROR: Error stopping agent process (" +
                                 juce::String(descriptor_.name) + "): " + e.what());
    }

    running_ = false;
    process_.reset();
}

bool AgentSupervisor::resume() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (running_)
        return true;

    return spawnLocked(true, std::string(restartAnnouncement));
}

std::future<void> AgentSupervisor::relayMessage(const std::string& text) {
    juce::Logger::writeToLog("Agent (" + juce::String(descriptor_.name) +
                             ") sending message to players: " + juce::String(text));

    std::promise<void> sent;
    sent.set_value();
    return sent.get_future();
}

bool AgentSupervisor::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

juce::int64 AgentSupervisor::getLastRestartTime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastRestart_;
}

int AgentSupervisor::getProcessId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_ ? process_->getProcessId() : -1;
}

}  // namespace drover
