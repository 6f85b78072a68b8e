#include "drover/console/command_registry.hpp"

#include "drover/console/command_context.hpp"

#include <algorithm>
#include <sstream>

namespace drover {

std::string foldCase(const std::string& text) {
    return juce::String(text).toLowerCase().toStdString();
}

CommandRegistry CommandRegistry::build(const std::vector<CommandEntry>& builtinCommands) {
    CommandRegistry registry;
    for (const auto& entry : builtinCommands) {
        registry.add(entry);
    }
    for (auto& entry : makeConsoleCommands()) {
        registry.add(std::move(entry));
    }
    return registry;
}

void CommandRegistry::add(CommandEntry entry) {
    if (entry.name.empty()) {
        return;
    }

    entry.name = foldCase(entry.name);
    for (auto& alias : entry.aliases) {
        alias = foldCase(alias);
    }

    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const CommandEntry& existing) { return existing.name == entry.name; });
    if (it != entries_.end()) {
        *it = std::move(entry);
    } else {
        entries_.push_back(std::move(entry));
    }
}

std::optional<std::string> CommandRegistry::resolve(const std::string& token) const {
    const auto folded = foldCase(token);

    for (const auto& entry : entries_) {
        if (entry.name == folded) {
            return entry.name;
        }
        if (std::find(entry.aliases.begin(), entry.aliases.end(), folded) != entry.aliases.end()) {
            return entry.name;
        }
    }

    return std::nullopt;
}

const CommandEntry* CommandRegistry::find(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

std::string CommandRegistry::formatHelp() const {
    std::ostringstream help;
    help << "Available commands:\n------------------";

    for (const auto& entry : entries_) {
        auto line = "  " + juce::String(entry.name).paddedRight(' ', 16) + juce::String(entry.description);

        if (!entry.aliases.empty()) {
            juce::StringArray aliases;
            for (const auto& alias : entry.aliases) {
                aliases.add(alias);
            }
            line << " (aliases: " << aliases.joinIntoString(", ") << ")";
        }

        help << "\n" << line.toStdString();
    }

    return help.str();
}

std::vector<CommandEntry> makeConsoleCommands() {
    std::vector<CommandEntry> commands;

    commands.push_back({"help", "Show this help message.", "!help or !?", {"?", "h"},
                        [](CommandContext& context, const juce::StringArray&) {
                            context.out << context.commands.formatHelp() << std::endl;
                        }});

    commands.push_back({"exit", "Exit the program.", "!exit", {"quit"},
                        [](CommandContext& context, const juce::StringArray&) {
                            context.out << "Exiting..." << std::endl;
                            context.requestExit(0);
                        }});

    return commands;
}

}  // namespace drover
