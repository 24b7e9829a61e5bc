#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "flowgate/core/config.hpp"

using namespace flowgate;

TEST_CASE("default_config returns sane defaults", "[core][config]") {
    auto cfg = default_config();

    CHECK(cfg.log_level == "info");
    CHECK_FALSE(cfg.policy_path.has_value());
    CHECK(cfg.engine.witness_on_allow == false);
    CHECK(cfg.audit.enabled == true);
    CHECK(cfg.audit.include_witness == true);
    CHECK_FALSE(cfg.snapshot.dir.has_value());
    CHECK(cfg.snapshot.verify_digest == true);
}

TEST_CASE("load_config parses JSON file correctly", "[core][config]") {
    namespace fs = std::filesystem;

    auto tmp = fs::temp_directory_path() / "flowgate_test_config.json";
    {
        std::ofstream out(tmp);
        out << R"({
            "log_level": "debug",
            "policy_path": "/etc/flowgate/policy.json",
            "engine": { "witness_on_allow": true },
            "snapshot": { "dir": "/var/lib/flowgate" }
        })";
    }

    auto cfg = load_config(tmp);

    CHECK(cfg.log_level == "debug");
    REQUIRE(cfg.policy_path.has_value());
    CHECK(*cfg.policy_path == "/etc/flowgate/policy.json");
    CHECK(cfg.engine.witness_on_allow == true);
    REQUIRE(cfg.snapshot.dir.has_value());
    CHECK(*cfg.snapshot.dir == "/var/lib/flowgate");
    // Non-specified fields keep defaults
    CHECK(cfg.audit.enabled == true);
    CHECK(cfg.snapshot.verify_digest == true);

    fs::remove(tmp);
}

TEST_CASE("load_config falls back to defaults", "[core][config]") {
    namespace fs = std::filesystem;

    SECTION("missing file") {
        auto cfg = load_config("/nonexistent/flowgate/config.json");
        CHECK(cfg.log_level == "info");
    }

    SECTION("unparseable file") {
        auto tmp = fs::temp_directory_path() / "flowgate_test_bad_config.json";
        {
            std::ofstream out(tmp);
            out << "{ not json";
        }
        auto cfg = load_config(tmp);
        CHECK(cfg.audit.enabled == true);
        fs::remove(tmp);
    }
}

TEST_CASE("Config path settings resolve ${VAR}", "[core][config]") {
    namespace fs = std::filesystem;

    setenv("FLOWGATE_TEST_HOME", "/srv/agent", 1);
    auto tmp = fs::temp_directory_path() / "flowgate_test_env_config.json";
    {
        std::ofstream out(tmp);
        out << R"({ "policy_path": "${FLOWGATE_TEST_HOME}/policy.json" })";
    }

    auto cfg = load_config(tmp);
    REQUIRE(cfg.policy_path.has_value());
    CHECK(*cfg.policy_path == "/srv/agent/policy.json");

    fs::remove(tmp);
}

TEST_CASE("load_config_from_env reads FLOWGATE_ variables", "[core][config]") {
    setenv("FLOWGATE_LOG_LEVEL", "warn", 1);
    setenv("FLOWGATE_POLICY", "/tmp/p.json", 1);
    unsetenv("FLOWGATE_SNAPSHOT_DIR");

    auto cfg = load_config_from_env();
    CHECK(cfg.log_level == "warn");
    REQUIRE(cfg.policy_path.has_value());
    CHECK(*cfg.policy_path == "/tmp/p.json");
    CHECK_FALSE(cfg.snapshot.dir.has_value());

    unsetenv("FLOWGATE_LOG_LEVEL");
    unsetenv("FLOWGATE_POLICY");
}

TEST_CASE("resolve_env_refs", "[core][config]") {
    SECTION("Resolves existing env var") {
        setenv("TEST_FLOWGATE_VAR", "hello_world", 1);
        CHECK(resolve_env_refs("prefix_${TEST_FLOWGATE_VAR}_suffix") ==
              "prefix_hello_world_suffix");
    }

    SECTION("Preserves unresolved vars") {
        CHECK(resolve_env_refs("value=${NONEXISTENT_VAR_12345}") ==
              "value=${NONEXISTENT_VAR_12345}");
    }

    SECTION("Escaped refs stay literal") {
        setenv("TEST_FLOWGATE_VAR", "hello_world", 1);
        CHECK(resolve_env_refs("$${TEST_FLOWGATE_VAR}") == "${TEST_FLOWGATE_VAR}");
    }

    SECTION("No refs returns input unchanged") {
        CHECK(resolve_env_refs("no refs here") == "no refs here");
    }
}

TEST_CASE("validate_config", "[core][config]") {
    auto cfg = default_config();
    CHECK(validate_config(cfg).has_value());

    SECTION("Unknown log level") {
        cfg.log_level = "chatty";
        auto result = validate_config(cfg);
        REQUIRE_FALSE(result);
        CHECK(result.error().code() == ErrorCode::InvalidConfig);
        CHECK(result.error().detail() == "chatty");
    }

    SECTION("Blank paths") {
        cfg.policy_path = "  ";
        CHECK_FALSE(validate_config(cfg));

        cfg.policy_path.reset();
        cfg.snapshot.dir = "";
        CHECK_FALSE(validate_config(cfg));
    }
}
