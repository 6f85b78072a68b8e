#pragma once

#include "agent_supervisor.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace drover {

/**
 * @brief Maps agent names to their supervisors
 *
 * Filled at startup and read by command handlers afterwards. Entries stay
 * registered after their worker stops so that they can be resumed.
 */
class FleetRegistry {
  public:
    /**
     * @brief Register a supervisor under its agent name
     * @return false if the supervisor is null or the name is already taken
     */
    bool add(std::shared_ptr<AgentSupervisor> supervisor);

    /**
     * @brief Find a supervisor by exact agent name
     * @return The supervisor, or nullptr if not found
     */
    std::shared_ptr<AgentSupervisor> find(const std::string& name) const;

    bool contains(const std::string& name) const;

    /**
     * @brief All agent names, sorted
     */
    std::vector<std::string> getNames() const;

    /**
     * @brief All supervisors, sorted by agent name
     */
    std::vector<std::shared_ptr<AgentSupervisor>> getAll() const;

    size_t size() const;

    /**
     * @brief Stop every running agent
     */
    void stopAll();

  private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<AgentSupervisor>> supervisors_;
};

}  // namespace drover
