#include <catch2/catch_test_macros.hpp>

#include "TestDoubles.hpp"
#include "drover/core/profile_loader.hpp"

using namespace drover;
using namespace drover_test;

TEST_CASE("loadProfile", "[profile]") {
    TempDirectory dir;
    std::string error;

    SECTION("Valid profile") {
        const auto path =
            dir.write("andy.json", R"({"name": "andy", "model": "gpt-4o", "modes": {"hunting": true}})");

        auto profile = loadProfile(path, error);

        REQUIRE(profile.has_value());
        REQUIRE(profile->name == "andy");
        REQUIRE(profile->document["model"].toString() == "gpt-4o");
        REQUIRE(error.empty());
    }

    SECTION("Missing file") {
        const auto path = dir.path("nobody.json");

        REQUIRE_FALSE(loadProfile(path, error).has_value());
        REQUIRE(error.find("Failed to read profile file") != std::string::npos);
        REQUIRE(error.find("nobody.json") != std::string::npos);
    }

    SECTION("Malformed JSON") {
        const auto path = dir.write("broken.json", R"({"name": "andy",)");

        REQUIRE_FALSE(loadProfile(path, error).has_value());
        REQUIRE(error.find("Failed to parse JSON for profile") != std::string::npos);
    }

    SECTION("Not an object") {
        const auto path = dir.write("list.json", R"(["andy"])");

        REQUIRE_FALSE(loadProfile(path, error).has_value());
        REQUIRE(error.find("is not a JSON object") != std::string::npos);
    }

    SECTION("Missing or empty name") {
        const auto unnamed = dir.write("unnamed.json", R"({"model": "gpt-4o"})");
        REQUIRE_FALSE(loadProfile(unnamed, error).has_value());
        REQUIRE(error.find("has no agent name") != std::string::npos);

        error.clear();
        const auto blank = dir.write("blank.json", R"({"name": "  "})");
        REQUIRE_FALSE(loadProfile(blank, error).has_value());
        REQUIRE(error.find("has no agent name") != std::string::npos);

        error.clear();
        const auto numeric = dir.write("numeric.json", R"({"name": 7})");
        REQUIRE_FALSE(loadProfile(numeric, error).has_value());
        REQUIRE(error.find("has no agent name") != std::string::npos);
    }
}
