#pragma once

#include "command_dispatcher.hpp"

#include <istream>

namespace drover {

/**
 * @brief Interactive operator console
 *
 * Prints the help listing, then reads lines from the input stream and
 * dispatches them until a command requests exit or the input ends.
 */
class ConsoleLoop {
  public:
    ConsoleLoop(const CommandRegistry& registry, CommandContext& context);

    /**
     * @brief Run until exit is requested or input ends
     * @return The exit code requested by a command, or 0 at end of input
     */
    int run(std::istream& in);

    static constexpr const char* prompt = "> ";

  private:
    CommandDispatcher dispatcher_;
    CommandContext& context_;
};

}  // namespace drover
