#include "flowgate/core/config.hpp"
#include "flowgate/core/logger.hpp"
#include "flowgate/core/utils.hpp"

#include <cstdlib>
#include <fstream>

namespace flowgate {

namespace {

void expand_path(std::optional<std::string>& path) {
    if (path) path = resolve_env_refs(*path);
}

void expand_paths(Config& config) {
    expand_path(config.policy_path);
    expand_path(config.snapshot.dir);
}

auto env(const char* name) -> std::optional<std::string> {
    if (const char* val = std::getenv(name)) return std::string(val);
    return std::nullopt;
}

auto blank_path(const std::optional<std::string>& path) -> bool {
    return path.has_value() && utils::trim(*path).empty();
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Config file {} not readable, using defaults", path.string());
        return default_config();
    }

    Config config;
    try {
        config = json::parse(file).get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Config file {} rejected, using defaults: {}", path.string(), e.what());
        return default_config();
    }

    expand_paths(config);
    LOG_DEBUG("Loaded config from {}", path.string());
    return config;
}

auto load_config_from_env() -> Config {
    Config config;
    if (auto level = env("FLOWGATE_LOG_LEVEL")) config.log_level = *level;
    if (auto policy = env("FLOWGATE_POLICY")) config.policy_path = *policy;
    if (auto dir = env("FLOWGATE_SNAPSHOT_DIR")) config.snapshot.dir = *dir;
    expand_paths(config);
    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto validate_config(const Config& config) -> VoidResult {
    if (!parse_log_level(config.log_level)) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "Unknown log_level", config.log_level));
    }
    if (blank_path(config.policy_path)) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig, "policy_path is blank"));
    }
    if (blank_path(config.snapshot.dir)) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig, "snapshot.dir is blank"));
    }
    return {};
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string out;
    out.reserve(input.size());

    std::size_t pos = 0;
    while (pos < input.size()) {
        auto dollar = input.find('$', pos);
        if (dollar == std::string_view::npos) {
            out.append(input.substr(pos));
            break;
        }
        out.append(input.substr(pos, dollar - pos));
        auto rest = input.substr(dollar);

        // "$$" is a literal '$'.
        if (rest.starts_with("$$")) {
            out += '$';
            pos = dollar + 2;
            continue;
        }

        auto close = rest.starts_with("${") ? rest.find('}') : std::string_view::npos;
        if (close == std::string_view::npos) {
            out += '$';
            pos = dollar + 1;
            continue;
        }

        auto reference = rest.substr(0, close + 1);
        auto name = std::string(reference.substr(2, reference.size() - 3));
        if (auto value = env(name.c_str())) {
            out += *value;
        } else {
            LOG_DEBUG("Config: unresolved env ref {}", reference);
            out.append(reference);
        }
        pos = dollar + reference.size();
    }

    return out;
}

} // namespace flowgate
