#include <catch2/catch.hpp>

#include <sift/config.hpp>

#include <cstdlib>

namespace
{
    using namespace sift;

    struct EnvGuard
    {
        const char *name;
        EnvGuard(const char *n, const char *value) : name(n) { ::setenv(n, value, 1); }
        ~EnvGuard() { ::unsetenv(name); }
    };
}

TEST_CASE("Defaults apply without arguments", "[config]")
{
    ConfigResult result = loadConfig({});
    REQUIRE(result);
    REQUIRE(result.config.dataRoot == std::filesystem::path("data"));
    REQUIRE(result.config.port == 8080);
    REQUIRE(result.config.queueCapacity == 100);
    REQUIRE(result.config.httpWorkers == 4);
}

TEST_CASE("Flags override defaults", "[config]")
{
    ConfigResult result = loadConfig({"/srv/items", "-p", "9090", "--queue", "5", "-w", "2", "-H", "127.0.0.1"});
    REQUIRE(result);
    REQUIRE(result.config.dataRoot == std::filesystem::path("/srv/items"));
    REQUIRE(result.config.port == 9090);
    REQUIRE(result.config.queueCapacity == 5);
    REQUIRE(result.config.httpWorkers == 2);
    REQUIRE(result.config.host == "127.0.0.1");
}

TEST_CASE("Environment sits between defaults and flags", "[config]")
{
    EnvGuard port("SIFT_PORT", "7000");
    EnvGuard queue("SIFT_QUEUE_CAPACITY", "12");

    ConfigResult fromEnv = loadConfig({});
    REQUIRE(fromEnv);
    REQUIRE(fromEnv.config.port == 7000);
    REQUIRE(fromEnv.config.queueCapacity == 12);

    ConfigResult overridden = loadConfig({"-p", "7001"});
    REQUIRE(overridden);
    REQUIRE(overridden.config.port == 7001);
    REQUIRE(overridden.config.queueCapacity == 12);
}

TEST_CASE("Invalid values are reported, not thrown", "[config]")
{
    REQUIRE_FALSE(loadConfig({"-p", "0"}));
    REQUIRE_FALSE(loadConfig({"-p", "70000"}));
    REQUIRE_FALSE(loadConfig({"-q", "abc"}));
    REQUIRE_FALSE(loadConfig({"-w"}));
    REQUIRE_FALSE(loadConfig({"--bogus"}));
    REQUIRE_FALSE(loadConfig({"a", "b"}));

    EnvGuard bad("SIFT_HTTP_WORKERS", "-1");
    ConfigResult result = loadConfig({});
    REQUIRE_FALSE(result);
    REQUIRE(result.message.find("SIFT_HTTP_WORKERS") != std::string::npos);
}

TEST_CASE("Help and version short-circuit parsing", "[config]")
{
    REQUIRE(loadConfig({"-h", "--bogus"}).showHelp);
    REQUIRE(loadConfig({"--version"}).showVersion);
}
