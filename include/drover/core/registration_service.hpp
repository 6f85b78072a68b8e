#pragma once

#include <memory>
#include <string>

namespace drover {

class AgentSupervisor;

/**
 * @brief Sink for agent registration events
 *
 * The supervisor side only notifies; nothing it does depends on what the
 * service does with the events.
 */
class RegistrationService {
  public:
    virtual ~RegistrationService() = default;

    /**
     * @brief Called once at startup, before any agent is registered
     */
    virtual void connect() = 0;

    /**
     * @brief Called once per agent at startup
     */
    virtual void registerAgent(const std::string& name,
                               std::weak_ptr<AgentSupervisor> supervisor) = 0;

    /**
     * @brief Called by a supervisor's exit observer each time its worker ends
     */
    virtual void logoutAgent(const std::string& name) = 0;
};

}  // namespace drover
