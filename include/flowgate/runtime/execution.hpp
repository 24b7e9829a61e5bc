#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "flowgate/core/error.hpp"
#include "flowgate/decision/engine.hpp"
#include "flowgate/graph/value_graph.hpp"

namespace flowgate::runtime {

/// State that crosses a suspend/resume boundary. The value graph is not
/// part of it; the host replays values into the resumed execution.
struct ExecutionSnapshot {
    std::string execution_id;
    std::vector<TokenId> held_tokens;
    std::uint64_t next_call = 1;
    Timestamp suspended_at = 0;
};

void to_json(json& j, const ExecutionSnapshot& s);
void from_json(const json& j, ExecutionSnapshot& s);

/// One agent run: its value graph, the tokens it holds and its call
/// counter. Tool calls are evaluated through the shared PolicyEngine.
class Execution {
public:
    Execution(std::string id, const decision::PolicyEngine& engine);

    Execution(const Execution&) = delete;
    Execution& operator=(const Execution&) = delete;

    [[nodiscard]] auto id() const noexcept -> const std::string& { return id_; }
    [[nodiscard]] auto graph() const noexcept -> const graph::ValueGraph& { return graph_; }

    /// Adds a value produced by the host. See ValueGraph::insert().
    auto record_value(ValueId id, labels::Label label, std::vector<ValueId> parents = {},
                      std::string operation = {}) -> VoidResult;

    void grant(const TokenId& token);
    void release(const TokenId& token);
    [[nodiscard]] auto held_tokens() const -> std::vector<TokenId>;

    /// Evaluates one tool call with the next call ID and the currently held
    /// tokens.
    auto evaluate(std::string tool, std::map<std::string, ValueId> arguments,
                  std::vector<labels::IntegrityLabel> pc_context = {},
                  std::optional<bool> redaction_applied = std::nullopt,
                  decision::LlmCallPath call_path = decision::LlmCallPath::Planner)
        -> decision::Evaluation;

    [[nodiscard]] auto suspend() const -> ExecutionSnapshot;

    /// Rebuilds an execution from a snapshot. Held tokens are revalidated
    /// at the store's current time; anything no longer Valid is dropped
    /// and reported through stripped_on_resume().
    static auto resume(const ExecutionSnapshot& snapshot, const decision::PolicyEngine& engine)
        -> std::unique_ptr<Execution>;

    [[nodiscard]] auto stripped_on_resume() const noexcept
        -> const std::vector<authority::StrippedToken>& { return stripped_on_resume_; }

private:
    std::string id_;
    const decision::PolicyEngine& engine_;
    graph::ValueGraph graph_;
    std::atomic<std::uint64_t> next_call_{1};

    mutable std::mutex tokens_mutex_;
    std::vector<TokenId> held_;

    std::vector<authority::StrippedToken> stripped_on_resume_;
};

} // namespace flowgate::runtime
