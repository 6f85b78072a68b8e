#pragma once

#include "command_context.hpp"
#include "command_registry.hpp"

#include <juce_core/juce_core.h>

#include <optional>
#include <string>

namespace drover {

/**
 * @brief A console line split into command token and arguments
 */
struct ParsedCommand {
    std::string token;
    juce::StringArray args;
};

/**
 * @brief Turns console lines into command handler invocations
 */
class CommandDispatcher {
  public:
    static constexpr char commandPrefix = '!';

    enum class Result { notACommand, unknownCommand, handled, failed };

    explicit CommandDispatcher(const CommandRegistry& registry);

    /**
     * @brief Split a line into command token and arguments
     * @return std::nullopt if the trimmed line does not start with the prefix
     */
    static std::optional<ParsedCommand> parseLine(const std::string& line);

    /**
     * @brief Parse, resolve and run one console line
     *
     * Unknown commands and handler failures are reported on the context's
     * output stream. Never throws.
     */
    Result dispatch(const std::string& line, CommandContext& context) const;

  private:
    const CommandRegistry& registry_;
};

}  // namespace drover
