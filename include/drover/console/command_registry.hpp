#pragma once

#include <juce_core/juce_core.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace drover {

struct CommandContext;

/**
 * @brief Handler invoked for a console command
 *
 * Receives the shared context and the raw argument list. Failures are
 * reported by throwing; the dispatcher catches and reports them.
 */
using CommandHandler = std::function<void(CommandContext& context, const juce::StringArray& args)>;

/**
 * @brief One console command and its metadata
 */
struct CommandEntry {
    std::string name;
    std::string description;
    std::string usage;
    std::vector<std::string> aliases;
    CommandHandler handler;
};

/**
 * @brief Name-keyed table of console commands, built once per session
 *
 * Names and aliases are stored lower-cased. Entries keep the order in which
 * they were first added; re-adding a name replaces the entry in place.
 */
class CommandRegistry {
  public:
    /**
     * @brief Build the session registry
     *
     * Takes the supplied commands and overlays the console-only `help` and
     * `exit` entries, which win over supplied entries of the same name.
     */
    static CommandRegistry build(const std::vector<CommandEntry>& builtinCommands);

    /**
     * @brief Resolve a typed token to a command name
     *
     * Case-insensitive match against names first, then aliases.
     * @return The canonical name, or std::nullopt if nothing matches
     */
    std::optional<std::string> resolve(const std::string& token) const;

    /**
     * @brief Look up an entry by canonical (lower-case) name
     * @return The entry, or nullptr if not found
     */
    const CommandEntry* find(const std::string& name) const;

    const std::vector<CommandEntry>& getEntries() const {
        return entries_;
    }

    size_t size() const {
        return entries_.size();
    }

    /**
     * @brief Add or replace an entry; entries without a name are ignored
     */
    void add(CommandEntry entry);

    /**
     * @brief Render the help listing for all entries
     */
    std::string formatHelp() const;

  private:
    std::vector<CommandEntry> entries_;
};

/**
 * @brief The console-only `help` and `exit` commands
 */
std::vector<CommandEntry> makeConsoleCommands();

std::string foldCase(const std::string& text);

}  // namespace drover
