#include "flowgate/policy/loader.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <stdexcept>

#include "flowgate/core/logger.hpp"
#include "flowgate/core/utils.hpp"

namespace flowgate::policy {

namespace {

/// Raised while walking a document; converted to SerializationError at the
/// parse_policy() boundary.
class SchemaViolation : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

[[noreturn]] void violation(std::string_view where, std::string_view what) {
    throw SchemaViolation(std::string(where) + ": " + std::string(what));
}

void reject_unknown_fields(const json& j, std::initializer_list<std::string_view> allowed,
                           std::string_view where) {
    if (!j.is_object()) violation(where, "expected an object");
    for (const auto& [key, _] : j.items()) {
        bool known = false;
        for (auto name : allowed) {
            if (key == name) {
                known = true;
                break;
            }
        }
        if (!known) violation(where, "unknown field `" + key + "`");
    }
}

auto field(const json& j, std::string_view key, std::string_view where) -> const json& {
    auto it = j.find(std::string(key));
    if (it == j.end()) violation(where, "missing field `" + std::string(key) + "`");
    return *it;
}

auto as_string(const json& j, std::string_view where) -> std::string {
    if (!j.is_string()) violation(where, "expected a string");
    return j.get<std::string>();
}

auto as_u64(const json& j, std::string_view where) -> std::uint64_t {
    if (!j.is_number_unsigned()) violation(where, "expected a non-negative integer");
    return j.get<std::uint64_t>();
}

auto as_bool(const json& j, std::string_view where) -> bool {
    if (!j.is_boolean()) violation(where, "expected a boolean");
    return j.get<bool>();
}

/// Optional list of strings; absent or null reads as empty.
auto string_list(const json& j, std::string_view key, std::string_view where)
    -> std::vector<std::string> {
    std::vector<std::string> out;
    auto it = j.find(std::string(key));
    if (it == j.end() || it->is_null()) return out;
    auto path = std::string(where) + "." + std::string(key);
    if (!it->is_array()) violation(path, "expected an array");
    for (const auto& item : *it) {
        out.push_back(as_string(item, path));
    }
    return out;
}

auto read_action(const json& j, std::string_view where) -> PolicyAction {
    auto text = as_string(j, where);
    auto action = parse_policy_action(text);
    if (!action) violation(where, "unknown action `" + text + "`");
    return *action;
}

auto read_side_effect(const json& j, std::string_view where) -> SideEffectClass {
    auto text = as_string(j, where);
    auto cls = parse_side_effect_class(text);
    if (!cls) violation(where, "unknown side-effect class `" + text + "`");
    return *cls;
}

auto read_budgets(const json& j) -> PolicyBudgets {
    constexpr std::string_view where = "budgets";
    reject_unknown_fields(j, {"max_values", "max_parents_per_value", "max_closure_steps",
                              "max_witness_depth"}, where);
    return PolicyBudgets{
        .max_values = as_u64(field(j, "max_values", where), "budgets.max_values"),
        .max_parents_per_value =
            as_u64(field(j, "max_parents_per_value", where), "budgets.max_parents_per_value"),
        .max_closure_steps =
            as_u64(field(j, "max_closure_steps", where), "budgets.max_closure_steps"),
        .max_witness_depth =
            as_u64(field(j, "max_witness_depth", where), "budgets.max_witness_depth"),
    };
}

auto read_context_rules(const json& j, std::string_view key, std::string_view where)
    -> std::optional<ContextRules> {
    auto it = j.find(std::string(key));
    if (it == j.end() || it->is_null()) return std::nullopt;
    auto path = std::string(where) + "." + std::string(key);
    reject_unknown_fields(*it, {"deny_if_pc_integrity_contains"}, path);
    return ContextRules{
        .deny_if_pc_integrity_contains =
            string_list(*it, "deny_if_pc_integrity_contains", path),
    };
}

auto read_optional_string(const json& j, std::string_view key, std::string_view where)
    -> std::optional<std::string> {
    auto it = j.find(std::string(key));
    if (it == j.end() || it->is_null()) return std::nullopt;
    return as_string(*it, std::string(where) + "." + std::string(key));
}

auto tools_array(const json& root) -> const json& {
    const auto& tools = field(root, "tools", "policy");
    if (!tools.is_array()) violation("policy.tools", "expected an array");
    return tools;
}

// ---------------------------------------------------------------------------
// Schema 1
// ---------------------------------------------------------------------------

auto read_v1_arg_rule(const json& j, std::string_view where) -> ArgRule {
    reject_unknown_fields(j, {"arg", "requires_integrity", "forbids_confidentiality"}, where);
    return ArgRule{
        .arg = as_string(field(j, "arg", where), std::string(where) + ".arg"),
        .requires_integrity = read_optional_string(j, "requires_integrity", where),
        .forbids_confidentiality = string_list(j, "forbids_confidentiality", where),
    };
}

auto read_v1_tool(const json& j, std::size_t index) -> ToolPolicy {
    auto where = "tools[" + std::to_string(index) + "]";
    reject_unknown_fields(j, {"tool", "side_effect_class", "required_authority",
                              "required_capability", "required_subject", "arg_rules",
                              "context_rules", "default_decision"}, where);

    ToolPolicy tool;
    tool.tool = as_string(field(j, "tool", where), where + ".tool");
    tool.side_effect_class =
        read_side_effect(field(j, "side_effect_class", where), where + ".side_effect_class");
    tool.required_authority = string_list(j, "required_authority", where);
    tool.required_capability = read_optional_string(j, "required_capability", where);
    tool.required_subject = read_optional_string(j, "required_subject", where);
    if (auto it = j.find("arg_rules"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) violation(where + ".arg_rules", "expected an array");
        for (std::size_t i = 0; i < it->size(); ++i) {
            tool.arg_rules.push_back(
                read_v1_arg_rule((*it)[i], where + ".arg_rules[" + std::to_string(i) + "]"));
        }
    }
    tool.context_rules = read_context_rules(j, "context_rules", where);
    tool.default_decision =
        read_action(field(j, "default_decision", where), where + ".default_decision");
    return tool;
}

// ---------------------------------------------------------------------------
// Schema 0 (legacy field names)
// ---------------------------------------------------------------------------

auto read_v0_arg_rule(const json& j, std::string_view where) -> ArgRule {
    reject_unknown_fields(j, {"name", "requires_integrity", "forbid_confidentiality"}, where);
    return ArgRule{
        .arg = as_string(field(j, "name", where), std::string(where) + ".name"),
        .requires_integrity = read_optional_string(j, "requires_integrity", where),
        .forbids_confidentiality = string_list(j, "forbid_confidentiality", where),
    };
}

auto read_v0_tool(const json& j, std::size_t index) -> ToolPolicy {
    auto where = "tools[" + std::to_string(index) + "]";
    reject_unknown_fields(j, {"name", "side_effect", "authority", "args", "context",
                              "default_decision"}, where);

    ToolPolicy tool;
    tool.tool = as_string(field(j, "name", where), where + ".name");
    tool.side_effect_class =
        read_side_effect(field(j, "side_effect", where), where + ".side_effect");
    tool.required_authority = string_list(j, "authority", where);
    if (auto it = j.find("args"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) violation(where + ".args", "expected an array");
        for (std::size_t i = 0; i < it->size(); ++i) {
            tool.arg_rules.push_back(
                read_v0_arg_rule((*it)[i], where + ".args[" + std::to_string(i) + "]"));
        }
    }
    tool.context_rules = read_context_rules(j, "context", where);
    tool.default_decision =
        read_action(field(j, "default_decision", where), where + ".default_decision");
    return tool;
}

/// Top-level fields shared by both schemas.
auto read_definition(const json& root, std::uint64_t version, bool legacy) -> PolicyDefinition {
    reject_unknown_fields(root, {"schema_version", "policy_name", "default_action",
                                 "strict_mode", "budgets", "tools"}, "policy");

    PolicyDefinition def;
    def.schema_version = version;
    def.policy_name = as_string(field(root, "policy_name", "policy"), "policy.policy_name");
    def.default_action =
        read_action(field(root, "default_action", "policy"), "policy.default_action");
    if (def.default_action != PolicyAction::Allow && def.default_action != PolicyAction::Deny) {
        violation("policy.default_action", "must be Allow or Deny");
    }
    def.strict_mode = as_bool(field(root, "strict_mode", "policy"), "policy.strict_mode");
    def.budgets = read_budgets(field(root, "budgets", "policy"));

    const auto& tools = tools_array(root);
    for (std::size_t i = 0; i < tools.size(); ++i) {
        def.tools.push_back(legacy ? read_v0_tool(tools[i], i) : read_v1_tool(tools[i], i));
    }
    return def;
}

// ---------------------------------------------------------------------------
// YAML documents
// ---------------------------------------------------------------------------

auto yaml_scalar(const YAML::Node& node) -> json {
    const auto& text = node.Scalar();
    // "!" marks a quoted or explicitly tagged scalar.
    if (node.Tag() == "!") return text;

    if (text == "~" || text == "null" || text == "Null" || text == "NULL") return nullptr;
    if (text == "true" || text == "True" || text == "TRUE") return true;
    if (text == "false" || text == "False" || text == "FALSE") return false;

    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (!text.empty() && text.front() != '-' && text.front() != '+') {
        std::uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec == std::errc{} && ptr == last) return value;
    } else if (text.size() > 1 && text.front() == '-') {
        std::int64_t value = 0;
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec == std::errc{} && ptr == last) return value;
    }
    return text;
}

auto yaml_to_json(const YAML::Node& node, const std::string& where) -> json {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar:
            return yaml_scalar(node);
        case YAML::NodeType::Sequence: {
            json out = json::array();
            for (std::size_t i = 0; i < node.size(); ++i) {
                out.push_back(yaml_to_json(node[i], where + "[" + std::to_string(i) + "]"));
            }
            return out;
        }
        case YAML::NodeType::Map: {
            json out = json::object();
            for (auto it = node.begin(); it != node.end(); ++it) {
                if (!it->first.IsScalar()) violation(where, "mapping keys must be scalars");
                auto key = it->first.Scalar();
                if (out.contains(key)) violation(where, "duplicate key `" + key + "`");
                auto path = where.empty() ? key : where + "." + key;
                out[key] = yaml_to_json(it->second, path);
            }
            return out;
        }
    }
    violation(where, "unsupported YAML node");
}

auto has_yaml_extension(const std::filesystem::path& path) -> bool {
    auto ext = path.extension().string();
    std::ranges::transform(ext, ext.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".yaml" || ext == ".yml";
}

/// nlohmann objects keep keys sorted, so a compact dump is canonical.
auto canonical_hash(const json& j) -> std::string {
    return utils::sha256(j.dump());
}

} // anonymous namespace

void to_json(json& j, const MigrationStepRecord& r) {
    j = json{
        {"from_schema_version", r.from_schema_version},
        {"to_schema_version", r.to_schema_version},
        {"transform_name", r.transform_name},
        {"input_hash", r.input_hash},
        {"output_hash", r.output_hash},
    };
}

void to_json(json& j, const MigrationAuditRecord& r) {
    j = json{
        {"source_schema_version", r.source_schema_version},
        {"target_schema_version", r.target_schema_version},
        {"source_document_hash", r.source_document_hash},
        {"target_document_hash", r.target_document_hash},
        {"migration_steps", r.migration_steps},
    };
}

auto policy_hash(const PolicyDefinition& policy) -> std::string {
    return canonical_hash(json(policy));
}

namespace {

/// Validates and, for schema 0, migrates a parsed document tree.
auto parse_policy_tree(const json& root) -> Result<PolicyLoadOutcome> {
    if (!root.is_object()) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Policy document must be an object"));
    }
    auto version_it = root.find("schema_version");
    if (version_it == root.end() || !version_it->is_number_unsigned()) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError,
            "Policy schema_version is missing or not a non-negative integer"));
    }
    auto version = version_it->get<std::uint64_t>();
    if (version != 0 && version != kCanonicalSchemaVersion) {
        return std::unexpected(make_error(
            ErrorCode::UnsupportedSchemaVersion,
            "Unsupported policy schema_version; only 1 is accepted (0 is migrated)",
            std::to_string(version)));
    }

    PolicyLoadOutcome outcome;
    try {
        if (version == kCanonicalSchemaVersion) {
            outcome.policy = read_definition(root, version, false);
            auto hash = policy_hash(outcome.policy);
            outcome.migration_audit = MigrationAuditRecord{
                .source_schema_version = kCanonicalSchemaVersion,
                .target_schema_version = kCanonicalSchemaVersion,
                .source_document_hash = hash,
                .target_document_hash = hash,
                .migration_steps = {},
            };
        } else {
            auto legacy = read_definition(root, 0, true);
            legacy.schema_version = kCanonicalSchemaVersion;
            outcome.policy = std::move(legacy);

            auto source_hash = canonical_hash(root);
            auto target_hash = policy_hash(outcome.policy);
            outcome.migration_audit = MigrationAuditRecord{
                .source_schema_version = 0,
                .target_schema_version = kCanonicalSchemaVersion,
                .source_document_hash = source_hash,
                .target_document_hash = target_hash,
                .migration_steps = {MigrationStepRecord{
                    .from_schema_version = 0,
                    .to_schema_version = kCanonicalSchemaVersion,
                    .transform_name = std::string(kMigrationV0ToV1),
                    .input_hash = source_hash,
                    .output_hash = target_hash,
                }},
            };
            LOG_INFO("Migrated policy '{}' from schema 0 to {}", outcome.policy.policy_name,
                     kCanonicalSchemaVersion);
        }
    } catch (const SchemaViolation& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Invalid policy document", e.what()));
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Invalid policy document", e.what()));
    }

    return outcome;
}

} // anonymous namespace

auto parse_policy(std::string_view text) -> Result<PolicyLoadOutcome> {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Policy is not valid JSON", e.what()));
    }
    return parse_policy_tree(root);
}

auto parse_policy_yaml(std::string_view text) -> Result<PolicyLoadOutcome> {
    json root;
    try {
        root = yaml_to_json(YAML::Load(std::string(text)), "");
    } catch (const YAML::Exception& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Policy is not valid YAML", e.what()));
    } catch (const SchemaViolation& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Invalid policy document", e.what()));
    }
    return parse_policy_tree(root);
}

auto load_policy(const std::filesystem::path& path) -> Result<PolicyLoadOutcome> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(
            ErrorCode::IoError, "Cannot open policy file", path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto outcome = has_yaml_extension(path) ? parse_policy_yaml(buffer.str())
                                            : parse_policy(buffer.str());
    if (!outcome) {
        LOG_ERROR("Failed to load policy {}: {}", path.string(), outcome.error().what());
        return outcome;
    }
    LOG_INFO("Loaded policy '{}' from {} ({} tools)", outcome->policy.policy_name,
             path.string(), outcome->policy.tools.size());
    return outcome;
}

} // namespace flowgate::policy
