#include "drover/console/command_dispatcher.hpp"

#include <stdexcept>

namespace drover {

CommandDispatcher::CommandDispatcher(const CommandRegistry& registry) : registry_(registry) {}

std::optional<ParsedCommand> CommandDispatcher::parseLine(const std::string& line) {
    const auto trimmed = juce::String(line).trim();
    if (!trimmed.startsWithChar(commandPrefix)) {
        return std::nullopt;
    }

    auto tokens = juce::StringArray::fromTokens(trimmed.substring(1), " \t", "");
    tokens.removeEmptyStrings();

    ParsedCommand parsed;
    if (!tokens.isEmpty()) {
        parsed.token = tokens[0].toStdString();
        tokens.remove(0);
        parsed.args = tokens;
    }
    return parsed;
}

CommandDispatcher::Result CommandDispatcher::dispatch(const std::string& line,
                                                      CommandContext& context) const {
    const auto parsed = parseLine(line);
    if (!parsed) {
        return Result::notACommand;
    }

    const auto name = registry_.resolve(parsed->token);
    const auto* entry = name ? registry_.find(*name) : nullptr;
    if (entry == nullptr) {
        context.out << "Unknown command, type " << commandPrefix << "help for options." << std::endl;
        return Result::unknownCommand;
    }

    try {
        if (!entry->handler) {
            throw std::runtime_error("No handler for command \"" + entry->name + "\"");
        }
        entry->handler(context, parsed->args);
    } catch (const std::exception& e) {
        context.out << "Command error: " << e.what() << std::endl;
        return Result::failed;
    } catch (...) {
        context.out << "Command error: unknown error" << std::endl;
        return Result::failed;
    }

    return Result::handled;
}

}  // namespace drover
