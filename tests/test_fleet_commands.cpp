#include <catch2/catch_test_macros.hpp>

#include "TestDoubles.hpp"
#include "drover/console/command_dispatcher.hpp"
#include "drover/console/fleet_commands.hpp"
#include "drover/core/fleet_registry.hpp"
#include "drover/core/settings.hpp"

#include <sstream>

using namespace drover;
using namespace drover_test;

namespace {

struct ConsoleFixture {
    ScriptedLauncher launcher;
    RecordingRegistration registration;
    ManualClock clock;
    FleetRegistry fleet;
    Settings settings;
    CommandRegistry registry = CommandRegistry::build(makeFleetCommands());
    std::ostringstream out;
    CommandContext context{fleet, registry, &registration, settings, out};
    CommandDispatcher dispatcher{registry};

    std::shared_ptr<AgentSupervisor> add(const std::string& name) {
        AgentDescriptor descriptor;
        descriptor.name = name;
        descriptor.profilePath = name + ".json";
        descriptor.index = static_cast<int>(fleet.size());

        AgentSupervisor::Environment env;
        env.launcher = &launcher;
        env.registration = &registration;
        env.workerCommand = juce::StringArray{"worker"};
        env.clock = clock.function();
        env.onFatalExit = [](int) {};

        auto supervisor = AgentSupervisor::create(std::move(descriptor), std::move(env));
        fleet.add(supervisor);
        return supervisor;
    }

    CommandDispatcher::Result run(const std::string& line) {
        out.str({});
        return dispatcher.dispatch(line, context);
    }

    bool printed(const std::string& text) const {
        return out.str().find(text) != std::string::npos;
    }
};

}  // namespace

TEST_CASE("Fleet command table", "[commands]") {
    ConsoleFixture f;

    REQUIRE(f.registry.resolve("ls") == "list");
    REQUIRE(f.registry.resolve("Agents") == "list");
    REQUIRE(f.registry.resolve("continue") == "resume");
    REQUIRE(f.registry.resolve("start") == "resume");
    REQUIRE(f.registry.resolve("say") == "msg");
    REQUIRE(f.registry.resolve("send") == "msg");
    REQUIRE(f.registry.resolve("stopall") == "stopall");
    REQUIRE(f.registry.resolve("restart") == "restart");

    // Six fleet commands plus help and exit
    REQUIRE(f.registry.size() == 8);
}

TEST_CASE("Fleet commands list", "[commands]") {
    ConsoleFixture f;

    SECTION("Empty fleet") {
        REQUIRE(f.run("!list") == CommandDispatcher::Result::handled);
        REQUIRE(f.printed("No agents registered."));
    }

    SECTION("Running and stopped agents") {
        auto andy = f.add("andy");
        f.add("bob");
        REQUIRE(andy->start());

        REQUIRE(f.run("!ls") == CommandDispatcher::Result::handled);
        REQUIRE(f.printed("Agents:"));
        REQUIRE(f.printed("  andy            running (pid 1000)"));
        REQUIRE(f.printed("  bob             stopped"));
        REQUIRE(f.out.str().find("andy") < f.out.str().find("bob"));
    }
}

TEST_CASE("Fleet commands stop and resume", "[commands]") {
    ConsoleFixture f;
    auto andy = f.add("andy");
    REQUIRE(andy->start());

    SECTION("Stop a running agent") {
        REQUIRE(f.run("!stop andy") == CommandDispatcher::Result::handled);
        REQUIRE(f.printed("Stopped agent andy."));
        REQUIRE_FALSE(andy->isRunning());
        REQUIRE(f.launcher.latest().state->interrupted);
    }

    SECTION("Stop an agent that is not running") {
        andy->stop();
        REQUIRE(f.run("!stop andy") == CommandDispatcher::Result::handled);
        REQUIRE(f.printed("Agent andy is not running."));
    }

    SECTION("Resume a stopped agent") {
        andy->stop();
        REQUIRE(f.run("!continue andy") == CommandDispatcher::Result::handled);
        REQUIRE(f.printed("Resumed agent andy."));
        REQUIRE(andy->isRunning());
        REQUIRE(f.launcher.launchCount() == 2);
        REQUIRE(f.launcher.latest().command.contains("-l"));
    }

    SECTION("Resume a running agent") {
        REQUIRE(f.run("!resume andy") == CommandDispatcher::Result::handled);
        REQUIRE(f.printed("Agent andy is already running."));
        REQUIRE(f.launcher.launchCount() == 1);
    }

    SECTION("Resume failure is reported") {
        andy->stop();
        f.launcher.failNextLaunch = true;
        REQUIRE(f.run("!resume andy") == CommandDispatcher::Result::failed);
        REQUIRE(f.printed("Failed to resume agent andy"));
    }

    SECTION("Restart stops then resumes") {
        REQUIRE(f.run("!restart andy") == CommandDispatcher::Result::handled);
        REQUIRE(f.printed("Restarted agent andy."));
        REQUIRE(f.launcher.launches[0].state->interrupted);
        REQUIRE(f.launcher.launchCount() == 2);
        REQUIRE(andy->getProcessId() == 1001);
    }

    SECTION("Stop all") {
        auto bob = f.add("bob");
        REQUIRE(bob->start());

        REQUIRE(f.run("!stopall") == CommandDispatcher::Result::handled);
        REQUIRE(f.printed("Stopped all agents."));
        REQUIRE_FALSE(andy->isRunning());
        REQUIRE_FALSE(bob->isRunning());
    }
}

TEST_CASE("Fleet commands argument errors", "[commands]") {
    ConsoleFixture f;
    f.add("andy");

    SECTION("Missing agent name") {
        REQUIRE(f.run("!stop") == CommandDispatcher::Result::failed);
        REQUIRE(f.printed("Usage: !stop <name>"));
    }

    SECTION("Unknown agent name") {
        REQUIRE(f.run("!resume zed") == CommandDispatcher::Result::failed);
        REQUIRE(f.printed("No agent named \"zed\""));
    }

    SECTION("Agent names are case sensitive") {
        REQUIRE(f.run("!stop Andy") == CommandDispatcher::Result::failed);
    }

    SECTION("Message needs text") {
        REQUIRE(f.run("!msg andy") == CommandDispatcher::Result::failed);
        REQUIRE(f.printed("Usage: !msg <name> <message>"));
    }
}

TEST_CASE("Fleet commands relay messages", "[commands]") {
    ConsoleFixture f;
    f.add("andy");
    ScopedLogCapture log;

    REQUIRE(f.run("!say andy hello   there friend") == CommandDispatcher::Result::handled);
    REQUIRE(f.printed("Message sent to andy."));
    REQUIRE(log.contains("hello there friend"));
}
