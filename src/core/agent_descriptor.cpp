#include "drover/core/agent_descriptor.hpp"

namespace drover {

juce::StringArray buildWorkerArguments(const AgentDescriptor& descriptor, bool loadMemory,
                                       const std::optional<std::string>& message) {
    juce::StringArray args;
    args.add(descriptor.name);
    args.add("-p");
    args.add(descriptor.profilePath);
    args.add("-c");
    args.add(juce::String(descriptor.index));

    if (loadMemory) {
        args.add("-l");
        args.add("true");
    }
    if (message && !message->empty()) {
        args.add("-m");
        args.add(*message);
    }
    if (descriptor.taskPath && !descriptor.taskPath->empty()) {
        args.add("-t");
        args.add(*descriptor.taskPath);
    }
    if (descriptor.taskId && !descriptor.taskId->empty()) {
        args.add("-i");
        args.add(*descriptor.taskId);
    }

    return args;
}

}  // namespace drover
