#include "drover/app/drover_app.hpp"

#include "drover/console/console_loop.hpp"
#include "drover/console/fleet_commands.hpp"
#include "drover/core/profile_loader.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace drover {

namespace {

std::string takeOptionValue(const juce::ArgumentList& args, int& index) {
    const auto text = args[index].text;

    // --option=value
    if (text.containsChar('=')) {
        return text.fromFirstOccurrenceOf("=", false, false).toStdString();
    }

    // --option value
    if (index + 1 >= args.size() || args[index + 1].isOption()) {
        throw std::invalid_argument("Missing value for " + text.toStdString());
    }
    return args[++index].text.toStdString();
}

}  // namespace

DroverApp::DroverApp(Settings& settings, WorkerLauncher& launcher,
                     AgentSupervisor::FatalExitHandler onFatalExit)
    : settings_(settings), launcher_(launcher), onFatalExit_(std::move(onFatalExit)) {
    if (!onFatalExit_) {
        onFatalExit_ = [this](int exitCode) { terminate(exitCode); };
    }

    if (settings_.getHostStatusServer()) {
        statusServer_ = std::make_unique<StatusServer>(settings_.getStatusServerPort());
    }
    proxy_ = std::make_unique<MainProxy>(statusServer_.get());
}

DroverApp::~DroverApp() {
    shutdown();
}

LaunchOptions DroverApp::parseArguments(const juce::ArgumentList& args) {
    LaunchOptions options;

    for (int i = 0; i < args.size(); ++i) {
        const auto text = args[i].text;

        if (text == "--help" || text == "-h") {
            options.showHelp = true;
        } else if (text == "--profiles") {
            while (i + 1 < args.size() && !args[i + 1].isOption()) {
                options.profiles.push_back(args[++i].text.toStdString());
            }
        } else if (text.startsWith("--profiles=")) {
            options.profiles.push_back(takeOptionValue(args, i));
        } else if (text == "--task_path" || text.startsWith("--task_path=")) {
            options.taskPath = takeOptionValue(args, i);
        } else if (text == "--task_id" || text.startsWith("--task_id=")) {
            options.taskId = takeOptionValue(args, i);
        } else if (text == "--settings" || text.startsWith("--settings=")) {
            options.settingsFile = takeOptionValue(args, i);
        } else {
            throw std::invalid_argument("Unknown argument: " + text.toStdString());
        }
    }

    return options;
}

void DroverApp::printUsage(std::ostream& out) {
    out << "Usage: drover [options]\n"
        << "\n"
        << "Options:\n"
        << "  --profiles <path...>  List of agent profile paths\n"
        << "  --task_path <path>    Path to task file to execute\n"
        << "  --task_id <id>        Task ID to execute\n"
        << "  --settings <file>     Settings file (default: drover.cfg)\n"
        << "  -h, --help            Show this help" << std::endl;
}

AgentSupervisor::Environment DroverApp::makeEnvironment() {
    AgentSupervisor::Environment env;
    env.launcher = &launcher_;
    env.registration = proxy_.get();
    env.workerCommand = settings_.getWorkerCommandTokens();
    env.clock = [] { return juce::Time::currentTimeMillis(); };
    env.onFatalExit = onFatalExit_;
    env.restartGuardMs = settings_.getRestartGuardMs();
    return env;
}

size_t DroverApp::startAgents(const std::vector<std::string>& profiles,
                              const LaunchOptions& options) {
    const auto initMessage = settings_.getInitMessage();

    for (size_t i = 0; i < profiles.size(); ++i) {
        std::string error;
        auto profile = loadProfile(profiles[i], error);
        if (!profile) {
            juce::Logger::writeToLog("ERROR: " + juce::String(error));
            continue;
        }

        if (fleet_.contains(profile->name)) {
            juce::Logger::writeToLog("ERROR: Duplicate agent name \"" + juce::String(profile->name) +
                                     "\" in profile \"" + juce::String(profiles[i]) +
                                     "\", skipping");
            continue;
        }

        AgentDescriptor descriptor;
        descriptor.name = profile->name;
        descriptor.profilePath = profiles[i];
        descriptor.index = static_cast<int>(i);
        descriptor.loadMemory = settings_.getLoadMemory();
        if (!initMessage.empty())
            descriptor.initMessage = initMessage;
        descriptor.taskPath = options.taskPath;
        descriptor.taskId = options.taskId;

        auto supervisor = AgentSupervisor::create(std::move(descriptor), makeEnvironment());

        proxy_->registerAgent(supervisor->getName(), supervisor);
        fleet_.add(supervisor);

        if (!supervisor->start()) {
            juce::Logger::writeToLog("ERROR: Failed to start agent \"" +
                                     juce::String(supervisor->getName()) + "\"");
            continue;
        }

        if (settings_.getStartupStaggerMs() > 0)
            juce::Thread::sleep(settings_.getStartupStaggerMs());
    }

    return fleet_.size();
}

int DroverApp::run(const LaunchOptions& options, std::istream& in, std::ostream& out) {
    const auto profiles = options.profiles.empty() ? settings_.getProfiles() : options.profiles;

    if (profiles.empty()) {
        std::cerr << "No agent profiles specified. Use --profiles or set profiles in the settings file."
                  << std::endl;
        return 1;
    }

    if (statusServer_ != nullptr && !statusServer_->start()) {
        juce::Logger::writeToLog("ERROR: Continuing without status server");
    }
    proxy_->connect();

    juce::StringArray profileList;
    for (const auto& path : profiles)
        profileList.add(path);
    out << "Loading agent profiles: " << profileList.joinIntoString(", ").toStdString() << std::endl;
    startAgents(profiles, options);

    const auto registry = CommandRegistry::build(makeFleetCommands());
    CommandContext context{fleet_, registry, proxy_.get(), settings_, out};

    ConsoleLoop console(registry, context);
    const int exitCode = console.run(in);

    shutdown();
    return exitCode;
}

void DroverApp::shutdown() {
    // Worker exits after this point must not reach the proxy, the status
    // server or the fatal exit handler, which go away with the app
    for (const auto& supervisor : fleet_.getAll())
        supervisor->detach();

    stopServices();
}

void DroverApp::stopServices() {
    fleet_.stopAll();

    if (statusServer_ != nullptr)
        statusServer_->stop();
}

void DroverApp::terminate(int exitCode) {
    juce::Logger::writeToLog("Terminating with exit code " + juce::String(exitCode));

    // Runs inside a supervisor's exit callback, so detaching would wait on itself
    stopServices();

    // The console thread is blocked reading input, so end the process here
    std::cout.flush();
    std::cerr.flush();
    std::_Exit(exitCode);
}

}  // namespace drover
