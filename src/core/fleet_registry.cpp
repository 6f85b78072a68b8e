#include "drover/core/fleet_registry.hpp"

namespace drover {

bool FleetRegistry::add(std::shared_ptr<AgentSupervisor> supervisor) {
    if (!supervisor) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const std::string name = supervisor->getName();
    if (supervisors_.find(name) != supervisors_.end()) {
        // Agent already registered
        return false;
    }

    supervisors_[name] = std::move(supervisor);
    return true;
}

std::shared_ptr<AgentSupervisor> FleetRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = supervisors_.find(name);
    if (it != supervisors_.end()) {
        return it->second;
    }

    return nullptr;
}

bool FleetRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return supervisors_.find(name) != supervisors_.end();
}

std::vector<std::string> FleetRegistry::getNames() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    names.reserve(supervisors_.size());
    for (const auto& [name, supervisor] : supervisors_) {
        names.push_back(name);
    }
    return names;
}

std::vector<std::shared_ptr<AgentSupervisor>> FleetRegistry::getAll() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::shared_ptr<AgentSupervisor>> result;
    result.reserve(supervisors_.size());
    for (const auto& pair : supervisors_) {
        result.push_back(pair.second);
    }
    return result;
}

size_t FleetRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return supervisors_.size();
}

void FleetRegistry::stopAll() {
    // Supervisors lock themselves; stop them outside the registry lock
    for (const auto& supervisor : getAll()) {
        supervisor->stop();
    }
}

}  // namespace drover
