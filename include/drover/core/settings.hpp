#pragma once

#include <juce_core/juce_core.h>

#include <string>
#include <vector>

namespace drover {

/**
 * Static configuration of the supervisor
 *
 * Holds the defaults used when the command line does not say otherwise.
 * Can be loaded from a simple key=value file.
 */
class Settings {
  public:
    Settings() = default;

    static Settings& getInstance();

    // Agent profiles
    std::vector<std::string> getProfiles() const {
        return profiles;
    }
    void setProfiles(const std::vector<std::string>& paths) {
        profiles = paths;
    }

    // Worker invocation
    std::string getWorkerCommand() const {
        return workerCommand;
    }
    void setWorkerCommand(const std::string& command) {
        workerCommand = command;
    }

    /**
     * @brief Worker command split into executable and leading arguments
     */
    juce::StringArray getWorkerCommandTokens() const;

    bool getLoadMemory() const {
        return loadMemory;
    }
    void setLoadMemory(bool load) {
        loadMemory = load;
    }

    std::string getInitMessage() const {
        return initMessage;
    }
    void setInitMessage(const std::string& message) {
        initMessage = message;
    }

    // Status server
    bool getHostStatusServer() const {
        return hostStatusServer;
    }
    void setHostStatusServer(bool host) {
        hostStatusServer = host;
    }

    int getStatusServerPort() const {
        return statusServerPort;
    }
    void setStatusServerPort(int port) {
        statusServerPort = port;
    }

    // Supervision timing
    int getStartupStaggerMs() const {
        return startupStaggerMs;
    }
    void setStartupStaggerMs(int ms) {
        startupStaggerMs = ms;
    }

    int getRestartGuardMs() const {
        return restartGuardMs;
    }
    void setRestartGuardMs(int ms) {
        restartGuardMs = ms;
    }

    /**
     * @brief Load settings from a key=value file
     * @return false if the file could not be opened; unknown keys and bad
     *         values are reported and skipped
     */
    bool loadFromFile(const std::string& filename);

  private:
    // Helper to parse a single config line
    void parseConfigLine(const std::string& key, const std::string& value);

    std::vector<std::string> profiles;
    std::string workerCommand = "node src/process/init_agent.js";
    bool loadMemory = false;
    std::string initMessage = "";  // Empty = no initial message

    bool hostStatusServer = false;
    int statusServerPort = 8080;

    int startupStaggerMs = 1000;  // Delay between agent launches
    int restartGuardMs = 10000;   // Minimum uptime before an automatic restart
};

}  // namespace drover
