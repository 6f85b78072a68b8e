#pragma once

#include <juce_core/juce_core.h>

#include <optional>
#include <string>

namespace drover {

/**
 * @brief The parts of an agent profile the supervisor needs
 *
 * The full JSON document is kept for collaborators; only the name is
 * interpreted here.
 */
struct AgentProfile {
    std::string name;
    juce::var document;
};

/**
 * @brief Read and parse a JSON agent profile
 * @param path Profile file path
 * @param error Receives a description of the failure
 * @return The profile, or std::nullopt if the file could not be read, is not
 *         valid JSON, or has no non-empty string "name"
 */
std::optional<AgentProfile> loadProfile(const std::string& path, std::string& error);

}  // namespace drover
