#include "drover/core/main_proxy.hpp"

#include "drover/net/status_server.hpp"

#include <juce_core/juce_core.h>

namespace drover {

MainProxy::MainProxy(StatusServer* statusServer) : statusServer_(statusServer) {}

void MainProxy::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = true;

    if (statusServer_ != nullptr) {
        juce::Logger::writeToLog("Main proxy connected to status server on port " +
                                 juce::String(statusServer_->getPort()));
    } else {
        juce::Logger::writeToLog("Main proxy connected (no status server)");
    }
}

void MainProxy::registerAgent(const std::string& name, std::weak_ptr<AgentSupervisor> supervisor) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        agents_[name].supervisor = std::move(supervisor);
    }

    juce::Logger::writeToLog("Registered agent " + juce::String(name));

    if (statusServer_ != nullptr)
        statusServer_->agentLoggedIn(name);
}

void MainProxy::logoutAgent(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = agents_.find(name);
        if (it == agents_.end()) {
            juce::Logger::writeToLog("Logout for unregistered agent " + juce::String(name));
            return;
        }
        ++it->second.logouts;
    }

    juce::Logger::writeToLog("Agent " + juce::String(name) + " logged out");

    if (statusServer_ != nullptr)
        statusServer_->agentLoggedOut(name);
}

bool MainProxy::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

std::vector<std::string> MainProxy::getRegisteredAgents() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    for (const auto& [name, registration] : agents_)
        names.push_back(name);
    return names;
}

int MainProxy::getLogoutCount(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = agents_.find(name);
    return it != agents_.end() ? it->second.logouts : 0;
}

}  // namespace drover
