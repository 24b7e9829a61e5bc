#include "flowgate/policy/policy.hpp"

namespace flowgate::policy {

auto policy_action_to_string(PolicyAction action) -> std::string_view {
    switch (action) {
        case PolicyAction::Allow: return "Allow";
        case PolicyAction::Deny: return "Deny";
        case PolicyAction::RequireConfirmation: return "RequireConfirmation";
        case PolicyAction::RequireDraft: return "RequireDraft";
    }
    return "Deny";
}

auto side_effect_class_to_string(SideEffectClass cls) -> std::string_view {
    switch (cls) {
        case SideEffectClass::ExternalRead: return "ExternalRead";
        case SideEffectClass::ExternalWrite: return "ExternalWrite";
    }
    return "ExternalWrite";
}

auto parse_policy_action(std::string_view text) -> std::optional<PolicyAction> {
    if (text == "Allow") return PolicyAction::Allow;
    if (text == "Deny") return PolicyAction::Deny;
    if (text == "RequireConfirmation") return PolicyAction::RequireConfirmation;
    if (text == "RequireDraft") return PolicyAction::RequireDraft;
    return std::nullopt;
}

auto parse_side_effect_class(std::string_view text) -> std::optional<SideEffectClass> {
    if (text == "ExternalRead") return SideEffectClass::ExternalRead;
    if (text == "ExternalWrite") return SideEffectClass::ExternalWrite;
    return std::nullopt;
}

void to_json(json& j, const PolicyBudgets& b) {
    j = json{
        {"max_values", b.max_values},
        {"max_parents_per_value", b.max_parents_per_value},
        {"max_closure_steps", b.max_closure_steps},
        {"max_witness_depth", b.max_witness_depth},
    };
}

void to_json(json& j, const ArgRule& r) {
    j = json{
        {"arg", r.arg},
        {"requires_integrity", r.requires_integrity ? json(*r.requires_integrity) : json(nullptr)},
        {"forbids_confidentiality", r.forbids_confidentiality},
    };
}

void to_json(json& j, const ContextRules& r) {
    j = json{{"deny_if_pc_integrity_contains", r.deny_if_pc_integrity_contains}};
}

void to_json(json& j, const ToolPolicy& t) {
    j = json{
        {"tool", t.tool},
        {"side_effect_class", t.side_effect_class},
        {"required_authority", t.required_authority},
        {"arg_rules", t.arg_rules},
        {"context_rules", t.context_rules ? json(*t.context_rules) : json(nullptr)},
        {"default_decision", t.default_decision},
    };
    if (t.required_capability) j["required_capability"] = *t.required_capability;
    if (t.required_subject) j["required_subject"] = *t.required_subject;
}

void to_json(json& j, const PolicyDefinition& p) {
    j = json{
        {"schema_version", p.schema_version},
        {"policy_name", p.policy_name},
        {"default_action", p.default_action},
        {"strict_mode", p.strict_mode},
        {"budgets", p.budgets},
        {"tools", p.tools},
    };
}

} // namespace flowgate::policy
