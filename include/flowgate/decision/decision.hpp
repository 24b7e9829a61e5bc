#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "flowgate/core/types.hpp"
#include "flowgate/labels/label.hpp"

namespace flowgate::decision {

enum class Verdict {
    Allow,
    Deny,
    RequireConfirmation,
    RequireDraft,
};

enum class DenyReason {
    UntrustedControlContext,     // PC context matched a deny pattern
    MissingAuthority,            // required scope not covered by valid tokens
    IntegrityRequirementNotMet,  // argument closure integrity does not match
    ConfidentialityForbidden,    // argument closure carries a forbidden tag
    BudgetExceeded,              // closure hit max_closure_steps
    MalformedRule,               // tool rule could not be resolved or applied
    RedactionNotApplied,         // sink call would leave without redaction
    UnknownValue,                // argument refers to a value not in the graph
    PolicyDefault,               // default_action or default_decision is Deny
    InternalFault,               // unexpected failure inside evaluation
};

/// Which model issued the call: the planner works from trusted queries, the
/// quarantined model transforms untrusted tool output.
enum class LlmCallPath {
    Planner,
    Quarantined,
};

NLOHMANN_JSON_SERIALIZE_ENUM(LlmCallPath, {
    {LlmCallPath::Planner, "Planner"},
    {LlmCallPath::Quarantined, "Quarantined"},
})

auto llm_call_path_to_string(LlmCallPath path) -> std::string_view;
auto parse_llm_call_path(std::string_view text) -> std::optional<LlmCallPath>;

auto verdict_to_string(Verdict verdict) -> std::string_view;
auto deny_reason_to_string(DenyReason reason) -> std::string_view;

/// Outcome of one evaluation. `reason` is set exactly when the verdict is
/// Deny; `argument` names the argument a per-argument check failed on.
struct Decision {
    Verdict verdict = Verdict::Deny;
    std::optional<DenyReason> reason;
    std::string detail;
    std::optional<std::string> argument;

    [[nodiscard]] static auto allow() -> Decision { return Decision{.verdict = Verdict::Allow}; }

    [[nodiscard]] static auto deny(DenyReason reason, std::string detail = {},
                                   std::optional<std::string> argument = std::nullopt)
        -> Decision {
        return Decision{
            .verdict = Verdict::Deny,
            .reason = reason,
            .detail = std::move(detail),
            .argument = std::move(argument),
        };
    }

    [[nodiscard]] auto is_allow() const noexcept -> bool { return verdict == Verdict::Allow; }
    [[nodiscard]] auto is_deny() const noexcept -> bool { return verdict == Verdict::Deny; }

    auto operator==(const Decision&) const -> bool = default;
};

void to_json(json& j, const Decision& d);

/// One tool call as reported by the host.
struct CallRequest {
    std::string execution_id;
    std::string call_id;
    std::string tool;
    std::map<std::string, ValueId> arguments;
    std::vector<labels::IntegrityLabel> pc_context;
    std::vector<TokenId> held_tokens;
    /// Host-reported for sink (ExternalWrite) tools; absent reads as false.
    std::optional<bool> redaction_applied;
    LlmCallPath call_path = LlmCallPath::Planner;
};

} // namespace flowgate::decision
