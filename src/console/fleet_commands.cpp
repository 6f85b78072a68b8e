#include "drover/console/fleet_commands.hpp"

#include "drover/console/command_context.hpp"
#include "drover/core/fleet_registry.hpp"

#include <stdexcept>

namespace drover {

namespace {

std::shared_ptr<AgentSupervisor> requireAgent(CommandContext& context,
                                              const juce::StringArray& args,
                                              const std::string& usage) {
    if (args.isEmpty()) {
        throw std::runtime_error("Usage: " + usage);
    }

    const auto name = args[0].toStdString();
    auto supervisor = context.fleet.find(name);
    if (!supervisor) {
        throw std::runtime_error("No agent named \"" + name + "\"");
    }
    return supervisor;
}

void listAgents(CommandContext& context, const juce::StringArray&) {
    const auto supervisors = context.fleet.getAll();
    if (supervisors.empty()) {
        context.out << "No agents registered." << std::endl;
        return;
    }

    context.out << "Agents:" << std::endl;
    for (const auto& supervisor : supervisors) {
        auto line = "  " + juce::String(supervisor->getName()).paddedRight(' ', 16);
        const int pid = supervisor->getProcessId();
        if (supervisor->isRunning() && pid >= 0) {
            line << "running (pid " << pid << ")";
        } else if (supervisor->isRunning()) {
            line << "running";
        } else {
            line << "stopped";
        }
        context.out << line.toStdString() << std::endl;
    }
}

void stopAgent(CommandContext& context, const juce::StringArray& args) {
    auto supervisor = requireAgent(context, args, "!stop <name>");
    if (!supervisor->isRunning()) {
        context.out << "Agent " << supervisor->getName() << " is not running." << std::endl;
        return;
    }

    supervisor->stop();
    context.out << "Stopped agent " << supervisor->getName() << "." << std::endl;
}

void resumeAgent(CommandContext& context, const juce::StringArray& args) {
    auto supervisor = requireAgent(context, args, "!resume <name>");
    if (supervisor->isRunning()) {
        context.out << "Agent " << supervisor->getName() << " is already running." << std::endl;
        return;
    }

    if (!supervisor->resume()) {
        throw std::runtime_error("Failed to resume agent " + supervisor->getName());
    }
    context.out << "Resumed agent " << supervisor->getName() << "." << std::endl;
}

void restartAgent(CommandContext& context, const juce::StringArray& args) {
    auto supervisor = requireAgent(context, args, "!restart <name>");

    supervisor->stop();
    if (!supervisor->resume()) {
        throw std::runtime_error("Failed to restart agent " + supervisor->getName());
    }
    context.out << "Restarted agent " << supervisor->getName() << "." << std::endl;
}

void stopAllAgents(CommandContext& context, const juce::StringArray&) {
    context.fleet.stopAll();
    context.out << "Stopped all agents." << std::endl;
}

void messageAgent(CommandContext& context, const juce::StringArray& args) {
    if (args.size() < 2) {
        throw std::runtime_error("Usage: !msg <name> <message>");
    }

    auto supervisor = requireAgent(context, args, "!msg <name> <message>");
    const auto text = args.joinIntoString(" ", 1).toStdString();

    // Propagates a relay failure to the dispatcher
    supervisor->relayMessage(text).get();
    context.out << "Message sent to " << supervisor->getName() << "." << std::endl;
}

}  // namespace

std::vector<CommandEntry> makeFleetCommands() {
    return {
        {"list", "List agents and whether they are running.", "!list", {"ls", "agents"}, listAgents},
        {"stop", "Stop an agent.", "!stop <name>", {}, stopAgent},
        {"resume", "Resume a stopped agent.", "!resume <name>", {"continue", "start"}, resumeAgent},
        {"restart", "Stop an agent and start it again.", "!restart <name>", {}, restartAgent},
        {"stopall", "Stop every agent.", "!stopall", {}, stopAllAgents},
        {"msg", "Relay a message on behalf of an agent.", "!msg <name> <message>", {"say", "send"},
         messageAgent},
    };
}

}  // namespace drover
