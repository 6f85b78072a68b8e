#pragma once

#include "drover/core/registration_service.hpp"
#include "drover/core/worker_launcher.hpp"

#include <juce_core/juce_core.h>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Test doubles shared by the supervisor, console and app tests
 *
 * The scripted launcher never starts a real process. Each launch is recorded
 * and the test decides when and how the "worker" exits.
 */
namespace drover_test {

struct ProcessState {
    int pid = 0;
    bool interrupted = false;
    bool failInterrupt = false;
};

class ScriptedProcess : public drover::WorkerProcess {
  public:
    explicit ScriptedProcess(std::shared_ptr<ProcessState> state) : state_(std::move(state)) {}

    int getProcessId() const override {
        return state_->pid;
    }

    void interrupt() override {
        if (state_->failInterrupt)
            throw std::runtime_error("No such process");
        state_->interrupted = true;
    }

  private:
    std::shared_ptr<ProcessState> state_;
};

class ScriptedLauncher : public drover::WorkerLauncher {
  public:
    struct Launch {
        juce::StringArray command;
        ExitObserver onExit;
        ErrorObserver onError;
        std::shared_ptr<ProcessState> state;
    };

    std::unique_ptr<drover::WorkerProcess> launch(const juce::StringArray& command,
                                                  ExitObserver onExit,
                                                  ErrorObserver onError) override {
        if (failNextLaunch) {
            failNextLaunch = false;
            if (onError)
                onError("spawn ENOENT");
            return nullptr;
        }

        auto state = std::make_shared<ProcessState>();
        state->pid = 1000 + static_cast<int>(launches.size());
        launches.push_back({command, std::move(onExit), std::move(onError), state});
        return std::make_unique<ScriptedProcess>(state);
    }

    /**
     * @brief Make the worker of launch @p index terminate
     */
    void exit(size_t index, std::optional<int> code, std::optional<std::string> signal = {}) {
        auto observer = launches.at(index).onExit;
        observer(drover::ExitStatus{code, signal});
    }

    /**
     * @brief Terminate the most recent launch
     */
    void exitLatest(std::optional<int> code, std::optional<std::string> signal = {}) {
        exit(launches.size() - 1, code, signal);
    }

    size_t launchCount() const {
        return launches.size();
    }

    const Launch& latest() const {
        return launches.back();
    }

    std::vector<Launch> launches;
    bool failNextLaunch = false;
};

class ManualClock {
  public:
    juce::int64 now = 0;

    std::function<juce::int64()> function() {
        return [this] { return now; };
    }

    void advance(juce::int64 ms) {
        now += ms;
    }
};

class RecordingRegistration : public drover::RegistrationService {
  public:
    void connect() override {
        ++connects;
    }

    void registerAgent(const std::string& name, std::weak_ptr<drover::AgentSupervisor>) override {
        registered.push_back(name);
    }

    void logoutAgent(const std::string& name) override {
        loggedOut.push_back(name);
    }

    int connects = 0;
    std::vector<std::string> registered;
    std::vector<std::string> loggedOut;
};

/**
 * @brief Captures juce::Logger output for the lifetime of the object
 */
class ScopedLogCapture : public juce::Logger {
  public:
    ScopedLogCapture() : previous_(juce::Logger::getCurrentLogger()) {
        juce::Logger::setCurrentLogger(this);
    }

    ~ScopedLogCapture() override {
        juce::Logger::setCurrentLogger(previous_);
    }

    bool contains(const std::string& fragment) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& message : messages_) {
            if (message.contains(juce::String(fragment)))
                return true;
        }
        return false;
    }

    juce::StringArray getMessages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

  protected:
    void logMessage(const juce::String& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.add(message);
    }

  private:
    juce::Logger* previous_;
    juce::StringArray messages_;
    mutable std::mutex mutex_;
};

/**
 * @brief Scratch directory removed when the test ends
 */
class TempDirectory {
  public:
    TempDirectory()
        : dir_(juce::File::getSpecialLocation(juce::File::tempDirectory)
                   .getNonexistentChildFile("drover_test", "", false)) {
        dir_.createDirectory();
    }

    ~TempDirectory() {
        dir_.deleteRecursively();
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    /**
     * @brief Write @p content to a file in the directory
     * @return Full path of the file
     */
    std::string write(const std::string& fileName, const std::string& content) const {
        auto file = dir_.getChildFile(juce::String(fileName));
        file.replaceWithText(juce::String(content), false, false, "\n");
        return file.getFullPathName().toStdString();
    }

    std::string path(const std::string& fileName) const {
        return dir_.getChildFile(juce::String(fileName)).getFullPathName().toStdString();
    }

  private:
    juce::File dir_;
};

}  // namespace drover_test
