#include "flowgate/decision/engine.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "flowgate/core/logger.hpp"
#include "flowgate/core/utils.hpp"

namespace flowgate::decision {

namespace {

auto closure_denial(closure::ClosureError error, const std::string& arg, ValueId id)
    -> Decision {
    switch (error) {
        case closure::ClosureError::BudgetExceeded:
            return Decision::deny(DenyReason::BudgetExceeded,
                                  "closure of value " + std::to_string(id) +
                                      " exceeded max_closure_steps",
                                  arg);
        case closure::ClosureError::UnknownValue:
            return Decision::deny(DenyReason::UnknownValue,
                                  "value " + std::to_string(id) + " is not in the graph", arg);
    }
    return Decision::deny(DenyReason::InternalFault, "unhandled closure error", arg);
}

auto missing_argument(const std::string& arg) -> Decision {
    return Decision::deny(DenyReason::MalformedRule,
                          "rule references argument `" + arg + "` absent from the call", arg);
}

auto from_action(policy::PolicyAction action) -> Decision {
    switch (action) {
        case policy::PolicyAction::Allow:
            return Decision::allow();
        case policy::PolicyAction::RequireConfirmation:
            return Decision{.verdict = Verdict::RequireConfirmation};
        case policy::PolicyAction::RequireDraft:
            return Decision{.verdict = Verdict::RequireDraft};
        case policy::PolicyAction::Deny:
            break;
    }
    return Decision::deny(DenyReason::PolicyDefault, "tool default decision is Deny");
}

/// Arguments whose value the graph has never seen have no provenance at all.
auto unknown_argument(const graph::ValueGraph& graph, const CallRequest& request)
    -> std::optional<Decision> {
    for (const auto& [name, id] : request.arguments) {
        if (!graph.contains(id)) {
            return Decision::deny(DenyReason::UnknownValue,
                                  "value " + std::to_string(id) + " is not in the graph", name);
        }
    }
    return std::nullopt;
}

void log_decision(const CallRequest& request, const Decision& d) {
    switch (d.verdict) {
        case Verdict::Allow:
            LOG_DEBUG("Allow {} [{}]", request.tool, request.call_id);
            break;
        case Verdict::Deny:
            LOG_WARN("Deny {} [{}]: {}{}{}", request.tool, request.call_id,
                     deny_reason_to_string(d.reason.value_or(DenyReason::InternalFault)),
                     d.argument ? " on argument " + *d.argument : std::string{},
                     d.detail.empty() ? std::string{} : " (" + d.detail + ")");
            break;
        case Verdict::RequireConfirmation:
        case Verdict::RequireDraft:
            LOG_INFO("{} {} [{}]", verdict_to_string(d.verdict), request.tool, request.call_id);
            break;
    }
}

} // anonymous namespace

PolicyEngine::PolicyEngine(std::shared_ptr<const policy::RuleTable> rules,
                           const authority::AuthorityStore& store,
                           EngineOptions options,
                           audit::AuditSink* sink)
    : rules_(std::move(rules))
    , store_(store)
    , options_(options)
    , sink_(sink)
{
}

auto PolicyEngine::graph_budgets() const -> graph::GraphBudgets {
    const auto& b = rules_->budgets();
    return graph::GraphBudgets{
        .max_values = static_cast<std::size_t>(b.max_values),
        .max_parents_per_value = static_cast<std::size_t>(b.max_parents_per_value),
    };
}

auto PolicyEngine::evaluate(const graph::ValueGraph& graph, const CallRequest& request) const
    -> Evaluation {
    Evaluation out;
    Timestamp now = 0;

    try {
        now = store_.clock().now();
        const auto* rule = rules_->find(request.tool);
        closure::ClosureEngine closures(
            graph, static_cast<std::size_t>(rules_->budgets().max_closure_steps));

        out.decision = run_cascade(graph, request, rule, now, closures, out);

        if (!out.decision.is_allow() || options_.witness_on_allow) {
            std::vector<std::pair<std::string, ValueId>> roots;
            if (out.decision.argument) {
                if (auto it = request.arguments.find(*out.decision.argument);
                    it != request.arguments.end()) {
                    roots.emplace_back(it->first, it->second);
                }
            }
            if (roots.empty()) {
                roots.assign(request.arguments.begin(), request.arguments.end());
            }
            witness::WitnessBuilder builder(
                graph, static_cast<std::size_t>(rules_->budgets().max_witness_depth));
            out.witness = builder.build(roots);
        }

        fill_audit(request, rule, now, closures, out);
    } catch (const std::exception& e) {
        LOG_ERROR("Evaluation of {} [{}] failed: {}", request.tool, request.call_id, e.what());
        out.decision = Decision::deny(DenyReason::InternalFault, e.what());
        out.witness.reset();
        out.audit = audit::SinkAuditRecord{
            .execution_id = request.execution_id,
            .call_id = request.call_id,
            .tool = request.tool,
            .decision = out.decision,
            .call_path = request.call_path,
            .policy_name = rules_->policy_name(),
            .evaluated_at = now,
        };
    }

    log_decision(request, out.decision);

    if (sink_) {
        try {
            sink_->record(out.audit);
        } catch (const std::exception& e) {
            LOG_ERROR("Audit sink rejected record for {}: {}", request.call_id, e.what());
        }
    }
    return out;
}

auto PolicyEngine::run_cascade(const graph::ValueGraph& graph, const CallRequest& request,
                               const policy::ToolRule* rule, Timestamp now,
                               closure::ClosureEngine& closures, Evaluation& out) const
    -> Decision {
    if (!rule) {
        if (rules_->default_action() != policy::PolicyAction::Allow) {
            return Decision::deny(DenyReason::PolicyDefault,
                                  "tool `" + request.tool + "` is not listed");
        }
        if (auto unknown = unknown_argument(graph, request)) return *unknown;
        return Decision::allow();
    }

    if (const auto* bad = std::get_if<policy::MalformedToolRule>(rule)) {
        return Decision::deny(DenyReason::MalformedRule, bad->problem);
    }

    return check_compiled(graph, request, std::get<policy::CompiledToolRule>(*rule), now,
                          closures, out);
}

auto PolicyEngine::check_compiled(const graph::ValueGraph& graph, const CallRequest& request,
                                  const policy::CompiledToolRule& rule, Timestamp now,
                                  closure::ClosureEngine& closures, Evaluation& out) const
    -> Decision {
    // 1. Context: was the choice of this tool made under a denied influence?
    if (rules_->strict_mode() && !rule.deny_pc_patterns.empty()) {
        for (const auto& label : request.pc_context) {
            for (const auto& pattern : rule.deny_pc_patterns) {
                if (pattern.matches(label)) {
                    return Decision::deny(DenyReason::UntrustedControlContext,
                                          "PC context contains " + label.to_string());
                }
            }
        }
    }

    // 2. Authority, against one point-in-time table.
    auto table = store_.snapshot();
    auto held = authority::validate_held_tokens(table, request.held_tokens, now);
    out.stripped_tokens = held.stripped;
    for (const auto& stripped : held.stripped) {
        LOG_DEBUG("Ignoring held token {} for {} ({})", stripped.id, request.call_id,
                  authority::token_status_to_string(stripped.status));
    }

    if (rule.needs_authority()) {
        // An unset requirement accepts whatever the token carries.
        auto covers = [&](const authority::AuthorityToken& token, const std::string& resource) {
            return token.grants(rule.required_subject.value_or(token.subject),
                                rule.required_capability.value_or(token.capability), resource);
        };
        auto grant_text = [&] {
            std::string text;
            if (rule.required_capability) text += " with capability " + *rule.required_capability;
            if (rule.required_subject) text += " for subject " + *rule.required_subject;
            return text;
        };

        std::vector<std::string> missing;
        for (const auto& resource : rule.required_authority) {
            bool covered = std::ranges::any_of(
                held.effective, [&](const auto& token) { return covers(token, resource); });
            if (!covered) missing.push_back(resource);
        }
        if (!missing.empty()) {
            return Decision::deny(DenyReason::MissingAuthority,
                                  "not covered" + grant_text() + ": " + utils::join(missing, ", "));
        }
        if (rule.required_authority.empty()) {
            bool any = std::ranges::any_of(held.effective, [&](const auto& token) {
                return std::ranges::any_of(
                    token.scope, [&](const auto& resource) { return covers(token, resource); });
            });
            if (!any) {
                return Decision::deny(DenyReason::MissingAuthority,
                                      "no valid token" + grant_text());
            }
        }
    }

    // 3. Integrity of each constrained argument's closure.
    for (const auto& check : rule.integrity_checks) {
        auto it = request.arguments.find(check.arg);
        if (it == request.arguments.end()) return missing_argument(check.arg);

        auto closure = closures.closure_of(it->second);
        if (!closure) return closure_denial(closure.error(), check.arg, it->second);

        if (!check.required.matches(closure->integrity)) {
            return Decision::deny(DenyReason::IntegrityRequirementNotMet,
                                  "closure integrity " + closure->integrity.to_string() +
                                      ", requires " + check.required.to_string(),
                                  check.arg);
        }
    }

    // 4. Confidentiality of each constrained argument's closure.
    for (const auto& check : rule.confidentiality_checks) {
        auto it = request.arguments.find(check.arg);
        if (it == request.arguments.end()) return missing_argument(check.arg);

        auto closure = closures.closure_of(it->second);
        if (!closure) return closure_denial(closure.error(), check.arg, it->second);

        auto hits = closure->confidentiality.intersection(check.forbidden);
        if (!hits.empty()) {
            return Decision::deny(DenyReason::ConfidentialityForbidden,
                                  "carries " + utils::join(hits, ", "), check.arg);
        }
    }

    // 5. Default. A sink call that would go ahead must have been redacted.
    if (auto unknown = unknown_argument(graph, request)) return *unknown;
    auto outcome = from_action(rule.default_decision);
    if (!outcome.is_deny() && rule.side_effect_class == policy::SideEffectClass::ExternalWrite &&
        !request.redaction_applied.value_or(false)) {
        return Decision::deny(DenyReason::RedactionNotApplied,
                              "sink call on the " +
                                  std::string(llm_call_path_to_string(request.call_path)) +
                                  " path was not redacted");
    }
    return outcome;
}

void PolicyEngine::fill_audit(const CallRequest& request, const policy::ToolRule* rule,
                              Timestamp now, closure::ClosureEngine& closures,
                              Evaluation& out) const {
    auto& record = out.audit;
    record.execution_id = request.execution_id;
    record.call_id = request.call_id;
    record.tool = request.tool;
    record.decision = out.decision;
    record.call_path = request.call_path;
    record.policy_name = rules_->policy_name();
    record.evaluated_at = now;

    if (rule) {
        auto side_effect = policy::rule_side_effect(*rule);
        record.side_effect_class = side_effect;
        if (side_effect == policy::SideEffectClass::ExternalWrite) {
            record.redaction_applied = request.redaction_applied.value_or(false);
        }
    }

    for (const auto& [name, id] : request.arguments) {
        auto closure = closures.closure_of(id);
        record.argument_confidentiality[name] =
            closure ? closure->confidentiality.tag_names()
                    : closure::LabelClosure::worst_case().confidentiality.tag_names();
    }

    if (out.witness && options_.include_witness_in_audit) {
        record.witness = json(*out.witness);
    }
}

} // namespace flowgate::decision
