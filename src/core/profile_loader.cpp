#include "drover/core/profile_loader.hpp"

namespace drover {

std::optional<AgentProfile> loadProfile(const std::string& path, std::string& error) {
    const auto file = juce::File::getCurrentWorkingDirectory().getChildFile(juce::String(path));

    if (!file.existsAsFile()) {
        error = "Failed to read profile file \"" + path + "\": file not found";
        return std::nullopt;
    }

    juce::var document;
    const auto result = juce::JSON::parse(file.loadFileAsString(), document);
    if (result.failed()) {
        error = "Failed to parse JSON for profile \"" + path +
                "\": " + result.getErrorMessage().toStdString();
        return std::nullopt;
    }

    if (!document.isObject()) {
        error = "Profile \"" + path + "\" is not a JSON object";
        return std::nullopt;
    }

    const auto& name = document["name"];
    if (!name.isString() || name.toString().trim().isEmpty()) {
        error = "Profile \"" + path + "\" has no agent name";
        return std::nullopt;
    }

    return AgentProfile{name.toString().toStdString(), document};
}

}  // namespace drover
