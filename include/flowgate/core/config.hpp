#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "flowgate/core/error.hpp"
#include "flowgate/core/types.hpp"

// Optional settings map to JSON null or an absent key.
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace flowgate {

struct EngineSettings {
    bool witness_on_allow = false;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(EngineSettings, witness_on_allow)

struct AuditSettings {
    bool enabled = true;
    bool include_witness = true;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(AuditSettings, enabled, include_witness)

struct SnapshotSettings {
    std::optional<std::string> dir;
    bool verify_digest = true;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SnapshotSettings, dir, verify_digest)

struct Config {
    std::string log_level = "info";
    std::optional<std::string> policy_path;
    EngineSettings engine;
    AuditSettings audit;
    SnapshotSettings snapshot;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, log_level, policy_path, engine, audit, snapshot)

/// Reads a JSON config file. A missing or unparseable file is logged and
/// yields defaults. Path settings have `${VAR}` references expanded.
auto load_config(const std::filesystem::path& path) -> Config;

/// Builds a config from FLOWGATE_LOG_LEVEL, FLOWGATE_POLICY and
/// FLOWGATE_SNAPSHOT_DIR.
auto load_config_from_env() -> Config;

auto default_config() -> Config;

/// Rejects settings that parse but cannot be used: an unknown log level or
/// a blank path. InvalidConfig names the offending key.
auto validate_config(const Config& config) -> VoidResult;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace flowgate
