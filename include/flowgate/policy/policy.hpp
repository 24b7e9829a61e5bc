#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "flowgate/core/types.hpp"

namespace flowgate::policy {

/// Canonical policy schema version accepted at evaluation time.
inline constexpr std::uint64_t kCanonicalSchemaVersion = 1;

enum class PolicyAction {
    Allow,
    Deny,
    RequireConfirmation,
    RequireDraft,
};

NLOHMANN_JSON_SERIALIZE_ENUM(PolicyAction, {
    {PolicyAction::Allow, "Allow"},
    {PolicyAction::Deny, "Deny"},
    {PolicyAction::RequireConfirmation, "RequireConfirmation"},
    {PolicyAction::RequireDraft, "RequireDraft"},
})

enum class SideEffectClass {
    ExternalRead,   // non-mutating external read
    ExternalWrite,  // mutating external write (a sink)
};

NLOHMANN_JSON_SERIALIZE_ENUM(SideEffectClass, {
    {SideEffectClass::ExternalRead, "ExternalRead"},
    {SideEffectClass::ExternalWrite, "ExternalWrite"},
})

auto policy_action_to_string(PolicyAction action) -> std::string_view;
auto side_effect_class_to_string(SideEffectClass cls) -> std::string_view;

/// Strict lookups: unknown names yield nullopt instead of a fallback value.
auto parse_policy_action(std::string_view text) -> std::optional<PolicyAction>;
auto parse_side_effect_class(std::string_view text) -> std::optional<SideEffectClass>;

struct PolicyBudgets {
    std::uint64_t max_values = 0;
    std::uint64_t max_parents_per_value = 0;
    std::uint64_t max_closure_steps = 0;
    std::uint64_t max_witness_depth = 0;

    auto operator==(const PolicyBudgets&) const -> bool = default;
};

struct ArgRule {
    std::string arg;
    std::optional<std::string> requires_integrity;
    std::vector<std::string> forbids_confidentiality;

    auto operator==(const ArgRule&) const -> bool = default;
};

struct ContextRules {
    std::vector<std::string> deny_if_pc_integrity_contains;

    auto operator==(const ContextRules&) const -> bool = default;
};

/// Per-tool entry exactly as written in the policy document. Values are
/// kept as text here; RuleTable::compile() interprets them.
struct ToolPolicy {
    std::string tool;
    SideEffectClass side_effect_class = SideEffectClass::ExternalRead;
    std::vector<std::string> required_authority;
    std::optional<std::string> required_capability;  // tokens must carry it
    std::optional<std::string> required_subject;     // tokens must be granted to it
    std::vector<ArgRule> arg_rules;
    std::optional<ContextRules> context_rules;
    PolicyAction default_decision = PolicyAction::Deny;

    auto operator==(const ToolPolicy&) const -> bool = default;
};

/// Validated policy document. Immutable input to evaluation.
struct PolicyDefinition {
    std::uint64_t schema_version = kCanonicalSchemaVersion;
    std::string policy_name;
    PolicyAction default_action = PolicyAction::Deny;
    bool strict_mode = false;
    PolicyBudgets budgets;
    std::vector<ToolPolicy> tools;

    auto operator==(const PolicyDefinition&) const -> bool = default;
};

void to_json(json& j, const PolicyBudgets& b);
void to_json(json& j, const ArgRule& r);
void to_json(json& j, const ContextRules& r);
void to_json(json& j, const ToolPolicy& t);
void to_json(json& j, const PolicyDefinition& p);

} // namespace flowgate::policy
