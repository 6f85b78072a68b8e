#include <catch2/catch_test_macros.hpp>

#include "TestDoubles.hpp"
#include "drover/core/main_proxy.hpp"
#include "drover/net/status_server.hpp"

using namespace drover;
using namespace drover_test;

TEST_CASE("MainProxy without a status server", "[proxy]") {
    MainProxy proxy;
    ScopedLogCapture log;

    REQUIRE_FALSE(proxy.isConnected());
    proxy.connect();
    REQUIRE(proxy.isConnected());

    proxy.registerAgent("jill", {});
    proxy.registerAgent("andy", {});
    REQUIRE(proxy.getRegisteredAgents() == std::vector<std::string>{"andy", "jill"});
    REQUIRE(log.contains("Registered agent andy"));

    proxy.logoutAgent("andy");
    proxy.logoutAgent("andy");
    REQUIRE(proxy.getLogoutCount("andy") == 2);
    REQUIRE(proxy.getLogoutCount("jill") == 0);

    SECTION("Logout for an unknown agent is only logged") {
        proxy.logoutAgent("ghost");
        REQUIRE(proxy.getLogoutCount("ghost") == 0);
        REQUIRE(log.contains("Logout for unregistered agent ghost"));
        REQUIRE(proxy.getRegisteredAgents().size() == 2);
    }
}

TEST_CASE("MainProxy forwards to the status server", "[proxy]") {
    StatusServer server(0);
    MainProxy proxy(&server);

    proxy.connect();
    proxy.registerAgent("andy", {});
    proxy.registerAgent("bob", {});
    REQUIRE(server.getLoggedInAgents() == std::vector<std::string>{"andy", "bob"});

    proxy.logoutAgent("bob");
    REQUIRE(server.getLoggedInAgents() == std::vector<std::string>{"andy"});

    // Unregistered names never reach the server
    server.agentLoggedIn("ghost");
    proxy.logoutAgent("ghost");
    REQUIRE(server.getLoggedInAgents() == std::vector<std::string>{"andy", "ghost"});
}
