#pragma once

#include "command_registry.hpp"

#include <vector>

namespace drover {

/**
 * @brief Built-in commands operating on the agent fleet
 *
 * list, stop, resume, restart, stopall and msg. Handlers throw
 * std::runtime_error on missing arguments or unknown agent names.
 */
std::vector<CommandEntry> makeFleetCommands();

}  // namespace drover
