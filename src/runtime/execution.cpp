#include "flowgate/runtime/execution.hpp"

#include <algorithm>

#include "flowgate/core/logger.hpp"
#include "flowgate/core/utils.hpp"

namespace flowgate::runtime {

void to_json(json& j, const ExecutionSnapshot& s) {
    j = json{
        {"execution_id", s.execution_id},
        {"held_tokens", s.held_tokens},
        {"next_call", s.next_call},
        {"suspended_at", s.suspended_at},
    };
}

void from_json(const json& j, ExecutionSnapshot& s) {
    s.execution_id = j.at("execution_id").get<std::string>();
    s.held_tokens = j.at("held_tokens").get<std::vector<TokenId>>();
    s.next_call = j.at("next_call").get<std::uint64_t>();
    s.suspended_at = j.value("suspended_at", Timestamp{0});
}

Execution::Execution(std::string id, const decision::PolicyEngine& engine)
    : id_(std::move(id))
    , engine_(engine)
    , graph_(engine.graph_budgets())
{
}

auto Execution::record_value(ValueId id, labels::Label label, std::vector<ValueId> parents,
                             std::string operation) -> VoidResult {
    auto result = graph_.insert(id, std::move(label), std::move(parents), std::move(operation));
    if (!result) {
        LOG_WARN("Execution {}: value {} rejected: {}", id_, id, result.error().what());
    }
    return result;
}

void Execution::grant(const TokenId& token) {
    std::lock_guard lock(tokens_mutex_);
    if (std::ranges::find(held_, token) == held_.end()) {
        held_.push_back(token);
    }
}

void Execution::release(const TokenId& token) {
    std::lock_guard lock(tokens_mutex_);
    std::erase(held_, token);
}

auto Execution::held_tokens() const -> std::vector<TokenId> {
    std::lock_guard lock(tokens_mutex_);
    return held_;
}

auto Execution::evaluate(std::string tool, std::map<std::string, ValueId> arguments,
                         std::vector<labels::IntegrityLabel> pc_context,
                         std::optional<bool> redaction_applied,
                         decision::LlmCallPath call_path) -> decision::Evaluation {
    decision::CallRequest request{
        .execution_id = id_,
        .call_id = utils::sequence_id("call", next_call_.fetch_add(1)),
        .tool = std::move(tool),
        .arguments = std::move(arguments),
        .pc_context = std::move(pc_context),
        .held_tokens = held_tokens(),
        .redaction_applied = redaction_applied,
        .call_path = call_path,
    };
    return engine_.evaluate(graph_, request);
}

auto Execution::suspend() const -> ExecutionSnapshot {
    ExecutionSnapshot snapshot{
        .execution_id = id_,
        .held_tokens = held_tokens(),
        .next_call = next_call_.load(),
        .suspended_at = engine_.store().clock().now(),
    };
    LOG_INFO("Execution {} suspended ({} held tokens)", id_, snapshot.held_tokens.size());
    return snapshot;
}

auto Execution::resume(const ExecutionSnapshot& snapshot, const decision::PolicyEngine& engine)
    -> std::unique_ptr<Execution> {
    const auto& store = engine.store();
    auto validation = store.revalidate_on_restore(snapshot.held_tokens, store.clock().now());

    auto execution = std::make_unique<Execution>(snapshot.execution_id, engine);
    execution->next_call_.store(snapshot.next_call);
    for (const auto& token : validation.effective) {
        execution->held_.push_back(token.id);
    }
    execution->stripped_on_resume_ = std::move(validation.stripped);

    LOG_INFO("Execution {} resumed: {} tokens kept, {} stripped", snapshot.execution_id,
             execution->held_.size(), execution->stripped_on_resume_.size());
    return execution;
}

} // namespace flowgate::runtime
