#include "flowgate/policy/rule_table.hpp"

#include "flowgate/core/logger.hpp"
#include "flowgate/core/utils.hpp"

namespace flowgate::policy {

namespace {

auto blank(std::string_view s) -> bool {
    return utils::trim(s).empty();
}

/// Either a compiled rule or the first problem found.
auto compile_tool(const ToolPolicy& entry) -> ToolRule {
    auto malformed = [&](std::string problem) -> ToolRule {
        return MalformedToolRule{
            .tool = entry.tool,
            .side_effect_class = entry.side_effect_class,
            .problem = std::move(problem),
        };
    };

    if (blank(entry.tool)) return malformed("empty tool name");

    CompiledToolRule rule;
    rule.tool = entry.tool;
    rule.side_effect_class = entry.side_effect_class;
    rule.default_decision = entry.default_decision;

    for (const auto& resource : entry.required_authority) {
        if (blank(resource)) return malformed("empty required_authority resource");
        rule.required_authority.insert(resource);
    }
    if (entry.required_capability && blank(*entry.required_capability)) {
        return malformed("empty required_capability");
    }
    if (entry.required_subject && blank(*entry.required_subject)) {
        return malformed("empty required_subject");
    }
    rule.required_capability = entry.required_capability;
    rule.required_subject = entry.required_subject;

    if (entry.context_rules) {
        for (const auto& text : entry.context_rules->deny_if_pc_integrity_contains) {
            auto pattern = labels::IntegrityPattern::parse(text);
            if (!pattern) return malformed("unparseable PC integrity pattern `" + text + "`");
            rule.deny_pc_patterns.push_back(std::move(*pattern));
        }
    }

    for (const auto& arg : entry.arg_rules) {
        if (blank(arg.arg)) return malformed("argument rule with empty argument name");

        if (arg.requires_integrity) {
            auto pattern = labels::IntegrityPattern::parse(*arg.requires_integrity);
            if (!pattern || pattern->level() == labels::IntegrityLevel::Untrusted) {
                return malformed("argument `" + arg.arg + "` requires_integrity `" +
                                 *arg.requires_integrity +
                                 "` is not Trusted or Verified(<tag>)");
            }
            rule.integrity_checks.push_back(IntegrityCheck{.arg = arg.arg, .required = *pattern});
        }

        if (!arg.forbids_confidentiality.empty()) {
            for (const auto& tag : arg.forbids_confidentiality) {
                if (blank(tag)) {
                    return malformed("argument `" + arg.arg + "` forbids an empty tag");
                }
            }
            rule.confidentiality_checks.push_back(ConfidentialityCheck{
                .arg = arg.arg,
                .forbidden = arg.forbids_confidentiality,
            });
        }
    }

    return rule;
}

} // anonymous namespace

auto rule_tool_name(const ToolRule& rule) -> const std::string& {
    return std::visit([](const auto& r) -> const std::string& { return r.tool; }, rule);
}

auto rule_side_effect(const ToolRule& rule) -> SideEffectClass {
    return std::visit([](const auto& r) { return r.side_effect_class; }, rule);
}

auto RuleTable::compile(const PolicyDefinition& policy) -> Result<RuleTable> {
    if (policy.tools.size() > kMaxToolRules) {
        return std::unexpected(make_error(
            ErrorCode::BudgetExceeded, "Policy declares too many tools",
            std::to_string(policy.tools.size()) + " > " + std::to_string(kMaxToolRules)));
    }

    RuleTable table;
    table.policy_name_ = policy.policy_name;
    table.default_action_ = policy.default_action;
    table.strict_mode_ = policy.strict_mode;
    table.budgets_ = policy.budgets;
    table.rules_.reserve(kMaxToolRules);

    for (const auto& entry : policy.tools) {
        if (auto it = table.index_.find(entry.tool); it != table.index_.end()) {
            // Neither definition can be trusted to be the intended one.
            auto& existing = table.rules_[it->second];
            existing = MalformedToolRule{
                .tool = entry.tool,
                .side_effect_class = SideEffectClass::ExternalWrite,
                .problem = "duplicate tool entry",
            };
            continue;
        }
        table.index_.emplace(entry.tool, table.rules_.size());
        table.rules_.push_back(compile_tool(entry));
    }

    for (const auto* bad : table.malformed()) {
        LOG_WARN("Policy '{}': tool '{}' is malformed ({}); calls will be denied",
                 table.policy_name_, bad->tool, bad->problem);
    }
    LOG_DEBUG("Compiled policy '{}': {} tool rules", table.policy_name_, table.rules_.size());
    return table;
}

auto RuleTable::find(std::string_view tool) const -> const ToolRule* {
    auto it = index_.find(tool);
    if (it == index_.end()) return nullptr;
    return &rules_[it->second];
}

auto RuleTable::malformed() const -> std::vector<const MalformedToolRule*> {
    std::vector<const MalformedToolRule*> out;
    for (const auto& rule : rules_) {
        if (const auto* bad = std::get_if<MalformedToolRule>(&rule)) {
            out.push_back(bad);
        }
    }
    return out;
}

} // namespace flowgate::policy
