#pragma once

#include <juce_core/juce_core.h>

#include <optional>
#include <string>

namespace drover {

/**
 * @brief Static launch parameters for one agent
 *
 * Built once at startup from a profile file and owned by the supervisor
 * that uses it to (re)start the worker.
 */
struct AgentDescriptor {
    std::string name;
    std::string profilePath;
    int index = 0;
    bool loadMemory = false;
    std::optional<std::string> initMessage;
    std::optional<std::string> taskPath;
    std::optional<std::string> taskId;
};

/**
 * @brief Build the worker argument list for a launch
 *
 * Produces `<name> -p <profile> -c <index> [-l true] [-m msg] [-t path] [-i id]`.
 * The worker executable itself is not included.
 *
 * @param descriptor The agent's launch parameters
 * @param loadMemory Whether the worker should load its previous memory
 * @param message Optional announcement passed with -m
 */
juce::StringArray buildWorkerArguments(const AgentDescriptor& descriptor, bool loadMemory,
                                       const std::optional<std::string>& message);

}  // namespace drover
