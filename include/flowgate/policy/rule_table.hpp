#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "flowgate/core/error.hpp"
#include "flowgate/labels/label.hpp"
#include "flowgate/policy/policy.hpp"

namespace flowgate::policy {

/// Upper bound on tool entries per policy.
inline constexpr std::size_t kMaxToolRules = 512;

struct IntegrityCheck {
    std::string arg;
    labels::IntegrityPattern required;
};

struct ConfidentialityCheck {
    std::string arg;
    std::vector<std::string> forbidden;
};

/// A tool entry resolved at load time: patterns parsed, scope deduplicated.
struct CompiledToolRule {
    std::string tool;
    SideEffectClass side_effect_class = SideEffectClass::ExternalRead;
    std::set<std::string> required_authority;
    std::optional<std::string> required_capability;
    std::optional<std::string> required_subject;
    std::vector<labels::IntegrityPattern> deny_pc_patterns;
    std::vector<IntegrityCheck> integrity_checks;
    std::vector<ConfidentialityCheck> confidentiality_checks;
    PolicyAction default_decision = PolicyAction::Deny;

    /// True when calls need at least one valid held token.
    [[nodiscard]] auto needs_authority() const noexcept -> bool {
        return !required_authority.empty() || required_capability || required_subject;
    }
};

/// A tool entry that could not be resolved. Calls to it are denied.
struct MalformedToolRule {
    std::string tool;
    SideEffectClass side_effect_class = SideEffectClass::ExternalWrite;
    std::string problem;
};

using ToolRule = std::variant<CompiledToolRule, MalformedToolRule>;

[[nodiscard]] auto rule_tool_name(const ToolRule& rule) -> const std::string&;
[[nodiscard]] auto rule_side_effect(const ToolRule& rule) -> SideEffectClass;

/// Tool name -> resolved rule, built once per policy and shared read-only by
/// every evaluation.
class RuleTable {
public:
    /// Resolves every tool entry. A bad entry becomes a MalformedToolRule
    /// rather than failing the whole policy; exceeding kMaxToolRules does
    /// fail, with BudgetExceeded.
    static auto compile(const PolicyDefinition& policy) -> Result<RuleTable>;

    [[nodiscard]] auto find(std::string_view tool) const -> const ToolRule*;

    [[nodiscard]] auto policy_name() const noexcept -> const std::string& { return policy_name_; }
    [[nodiscard]] auto default_action() const noexcept -> PolicyAction { return default_action_; }
    [[nodiscard]] auto strict_mode() const noexcept -> bool { return strict_mode_; }
    [[nodiscard]] auto budgets() const noexcept -> const PolicyBudgets& { return budgets_; }

    [[nodiscard]] auto rules() const noexcept -> const std::vector<ToolRule>& { return rules_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return rules_.size(); }
    [[nodiscard]] auto malformed() const -> std::vector<const MalformedToolRule*>;

private:
    RuleTable() = default;

    std::string policy_name_;
    PolicyAction default_action_ = PolicyAction::Deny;
    bool strict_mode_ = false;
    PolicyBudgets budgets_;
    std::vector<ToolRule> rules_;
    std::map<std::string, std::size_t, std::less<>> index_;
};

} // namespace flowgate::policy
