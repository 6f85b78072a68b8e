#pragma once

/**
 * @file drover.hpp
 * @brief Main header for drover, the agent process supervisor
 *
 * drover launches a fixed set of named worker processes ("agents"), restarts
 * them when they fail, and gives the operator a console to inspect and
 * control the fleet.
 */

#include "drover/app/drover_app.hpp"
#include "drover/console/command_dispatcher.hpp"
#include "drover/console/command_registry.hpp"
#include "drover/console/console_loop.hpp"
#include "drover/console/fleet_commands.hpp"
#include "drover/core/agent_supervisor.hpp"
#include "drover/core/fleet_registry.hpp"
#include "drover/core/main_proxy.hpp"
#include "drover/core/profile_loader.hpp"
#include "drover/core/settings.hpp"
#include "drover/core/worker_launcher.hpp"

namespace drover {

/**
 * @brief Current version of drover
 */
constexpr const char* DROVER_VERSION = "0.1.0";

/**
 * @brief Settings file read from the working directory when present
 */
constexpr const char* DROVER_DEFAULT_SETTINGS_FILE = "drover.cfg";

}  // namespace drover
