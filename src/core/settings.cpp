#include "drover/core/settings.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace drover {

namespace {

bool parseBool(const std::string& value) {
    const auto lowered = juce::String(value).trim().toLowerCase();
    if (lowered == "true" || lowered == "1" || lowered == "yes")
        return true;
    if (lowered == "false" || lowered == "0" || lowered == "no")
        return false;
    throw std::invalid_argument("expected a boolean");
}

}  // namespace

Settings& Settings::getInstance() {
    static Settings instance;
    return instance;
}

juce::StringArray Settings::getWorkerCommandTokens() const {
    auto tokens = juce::StringArray::fromTokens(juce::String(workerCommand), true);
    tokens.removeEmptyStrings();
    for (auto& token : tokens)
        token = token.unquoted();
    return tokens;
}

bool Settings::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cout << "Settings file not found, using defaults: " << filename << std::endl;
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#')
            continue;

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
            continue;

        std::string key = juce::String(line.substr(0, equalPos)).trim().toStdString();
        std::string value = line.substr(equalPos + 1);

        parseConfigLine(key, value);
    }

    std::cout << "Settings loaded from: " << filename << std::endl;
    return true;
}

void Settings::parseConfigLine(const std::string& key, const std::string& value) {
    try {
        if (key == "profiles") {
            profiles.clear();
            // Tab-delimited, or comma-delimited when no tab is present
            auto separator = (value.find('\t') != std::string::npos) ? "\t" : ",";
            auto tokens = juce::StringArray::fromTokens(juce::String(value), separator, "");
            tokens.trim();
            tokens.removeEmptyStrings();
            for (const auto& path : tokens)
                profiles.push_back(path.toStdString());
            return;
        }
        if (key == "workerCommand") {
            workerCommand = juce::String(value).trim().toStdString();
            return;
        }
        if (key == "initMessage") {
            initMessage = value;
            return;
        }
        if (key == "loadMemory") {
            loadMemory = parseBool(value);
            return;
        }
        if (key == "hostStatusServer") {
            hostStatusServer = parseBool(value);
            return;
        }

        // Handle numeric values
        if (key == "statusServerPort") {
            statusServerPort = std::stoi(value);
        } else if (key == "startupStaggerMs") {
            startupStaggerMs = std::stoi(value);
        } else if (key == "restartGuardMs") {
            restartGuardMs = std::stoi(value);
        } else {
            std::cerr << "Unknown settings key: " << key << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error parsing settings value: " << key << "=" << value << " (" << e.what()
                  << ")" << std::endl;
    }
}

}  // namespace drover
