#pragma once

#include <ostream>

namespace drover {

class CommandRegistry;
class FleetRegistry;
class RegistrationService;
class Settings;

/**
 * @brief State shared by every command handler
 */
struct CommandContext {
    FleetRegistry& fleet;
    const CommandRegistry& commands;
    RegistrationService* registration;
    const Settings& settings;
    std::ostream& out;

    bool exitRequested = false;
    int exitCode = 0;

    /**
     * @brief Ask the console loop to finish after the current command
     */
    void requestExit(int code) {
        exitRequested = true;
        exitCode = code;
    }
};

}  // namespace drover
