#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "flowgate/audit/audit.hpp"
#include "flowgate/authority/authority_store.hpp"
#include "flowgate/closure/closure_engine.hpp"
#include "flowgate/decision/decision.hpp"
#include "flowgate/graph/value_graph.hpp"
#include "flowgate/policy/rule_table.hpp"
#include "flowgate/witness/witness.hpp"

namespace flowgate::decision {

struct EngineOptions {
    bool witness_on_allow = false;
    bool include_witness_in_audit = true;
};

/// Everything one evaluate() call produces.
struct Evaluation {
    Decision decision;
    std::optional<witness::Witness> witness;
    audit::SinkAuditRecord audit;
    std::vector<authority::StrippedToken> stripped_tokens;
};

/// Runs the decision cascade for tool calls against one compiled policy.
///
/// Checks run in a fixed order and stop at the first denial:
/// context, authority, per-argument integrity, per-argument
/// confidentiality, then the tool's (or policy's) default. Authority is
/// covered only by valid held tokens matching the rule's capability and
/// subject, when it names them. A sink tool whose default would let the
/// call proceed is denied unless the host applied redaction. Every failure
/// inside the checks resolves to Deny; nothing propagates to the caller.
///
/// evaluate() is const and may be called concurrently. Each call validates
/// tokens against a single TokenTable snapshot and computes closures with
/// its own ClosureEngine.
class PolicyEngine {
public:
    PolicyEngine(std::shared_ptr<const policy::RuleTable> rules,
                 const authority::AuthorityStore& store,
                 EngineOptions options = {},
                 audit::AuditSink* sink = nullptr);

    [[nodiscard]] auto evaluate(const graph::ValueGraph& graph, const CallRequest& request) const
        -> Evaluation;

    [[nodiscard]] auto rules() const noexcept -> const policy::RuleTable& { return *rules_; }
    [[nodiscard]] auto store() const noexcept -> const authority::AuthorityStore& { return store_; }
    [[nodiscard]] auto options() const noexcept -> const EngineOptions& { return options_; }

    /// Value graph budgets declared by the policy.
    [[nodiscard]] auto graph_budgets() const -> graph::GraphBudgets;

private:
    auto run_cascade(const graph::ValueGraph& graph, const CallRequest& request,
                     const policy::ToolRule* rule, Timestamp now,
                     closure::ClosureEngine& closures, Evaluation& out) const -> Decision;

    auto check_compiled(const graph::ValueGraph& graph, const CallRequest& request,
                        const policy::CompiledToolRule& rule, Timestamp now,
                        closure::ClosureEngine& closures, Evaluation& out) const -> Decision;

    void fill_audit(const CallRequest& request, const policy::ToolRule* rule, Timestamp now,
                    closure::ClosureEngine& closures, Evaluation& out) const;

    std::shared_ptr<const policy::RuleTable> rules_;
    const authority::AuthorityStore& store_;
    EngineOptions options_;
    audit::AuditSink* sink_;
};

} // namespace flowgate::decision
