#include "flowgate/decision/decision.hpp"

namespace flowgate::decision {

auto llm_call_path_to_string(LlmCallPath path) -> std::string_view {
    switch (path) {
        case LlmCallPath::Planner: return "Planner";
        case LlmCallPath::Quarantined: return "Quarantined";
    }
    return "Quarantined";
}

auto parse_llm_call_path(std::string_view text) -> std::optional<LlmCallPath> {
    if (text == "Planner") return LlmCallPath::Planner;
    if (text == "Quarantined") return LlmCallPath::Quarantined;
    return std::nullopt;
}

auto verdict_to_string(Verdict verdict) -> std::string_view {
    switch (verdict) {
        case Verdict::Allow: return "Allow";
        case Verdict::Deny: return "Deny";
        case Verdict::RequireConfirmation: return "RequireConfirmation";
        case Verdict::RequireDraft: return "RequireDraft";
    }
    return "Deny";
}

auto deny_reason_to_string(DenyReason reason) -> std::string_view {
    switch (reason) {
        case DenyReason::UntrustedControlContext: return "UntrustedControlContext";
        case DenyReason::MissingAuthority: return "MissingAuthority";
        case DenyReason::IntegrityRequirementNotMet: return "IntegrityRequirementNotMet";
        case DenyReason::ConfidentialityForbidden: return "ConfidentialityForbidden";
        case DenyReason::BudgetExceeded: return "BudgetExceeded";
        case DenyReason::MalformedRule: return "MalformedRule";
        case DenyReason::RedactionNotApplied: return "RedactionNotApplied";
        case DenyReason::UnknownValue: return "UnknownValue";
        case DenyReason::PolicyDefault: return "PolicyDefault";
        case DenyReason::InternalFault: return "InternalFault";
    }
    return "InternalFault";
}

void to_json(json& j, const Decision& d) {
    j = json{{"verdict", std::string(verdict_to_string(d.verdict))}};
    if (d.reason) j["reason"] = std::string(deny_reason_to_string(*d.reason));
    if (!d.detail.empty()) j["detail"] = d.detail;
    if (d.argument) j["argument"] = *d.argument;
}

} // namespace flowgate::decision
