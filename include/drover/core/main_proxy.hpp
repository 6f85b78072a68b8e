#pragma once

#include "registration_service.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace drover {

class StatusServer;

/**
 * @brief Registration service used by the application
 *
 * Keeps track of which agents are registered and logged in, logs every
 * event, and forwards login/logout to the status server when one is hosted.
 */
class MainProxy : public RegistrationService {
  public:
    /**
     * @param statusServer Optional server to notify; may be null
     */
    explicit MainProxy(StatusServer* statusServer = nullptr);

    void connect() override;
    void registerAgent(const std::string& name,
                       std::weak_ptr<AgentSupervisor> supervisor) override;
    void logoutAgent(const std::string& name) override;

    bool isConnected() const;

    /**
     * @brief Names of all registered agents, sorted
     */
    std::vector<std::string> getRegisteredAgents() const;

    /**
     * @brief Number of logouts observed for an agent
     */
    int getLogoutCount(const std::string& name) const;

  private:
    struct Registration {
        std::weak_ptr<AgentSupervisor> supervisor;
        int logouts = 0;
    };

    StatusServer* statusServer_;
    bool connected_ = false;
    std::map<std::string, Registration> agents_;
    mutable std::mutex mutex_;
};

}  // namespace drover
