#include "flowgate/graph/value_graph.hpp"

#include <unordered_set>

#include "flowgate/core/logger.hpp"

namespace flowgate::graph {

ValueGraph::ValueGraph(GraphBudgets budgets)
    : budgets_(budgets)
{
}

auto ValueGraph::insert(ValueId id, labels::Label label, std::vector<ValueId> parents,
                        std::string operation) -> VoidResult {
    if (parents.size() > budgets_.max_parents_per_value) {
        LOG_WARN("Value {} has {} parents, budget is {}", id, parents.size(),
                 budgets_.max_parents_per_value);
        return std::unexpected(make_error(
            ErrorCode::BudgetExceeded, "max_parents_per_value exceeded",
            std::to_string(id)));
    }

    std::unordered_set<ValueId> seen;
    for (auto parent : parents) {
        if (!seen.insert(parent).second) {
            return std::unexpected(make_error(
                ErrorCode::InvalidArgument, "Repeated parent edge",
                std::to_string(id) + " -> " + std::to_string(parent)));
        }
    }

    std::unique_lock lock(mutex_);

    if (!nodes_.empty() && id <= last_id_) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument, "Value IDs must be strictly increasing",
            std::to_string(id)));
    }
    if (nodes_.size() >= budgets_.max_values) {
        LOG_WARN("Value graph full ({} values), rejecting value {}", nodes_.size(), id);
        return std::unexpected(make_error(
            ErrorCode::BudgetExceeded, "max_values exceeded", std::to_string(id)));
    }
    // Every parent already exists and therefore has a smaller ID: no edge can
    // point forward, so no cycle can form.
    for (auto parent : parents) {
        if (!nodes_.contains(parent)) {
            return std::unexpected(make_error(
                ErrorCode::NotFound, "Unknown parent value",
                std::to_string(id) + " -> " + std::to_string(parent)));
        }
    }

    nodes_.emplace(id, ValueNode{
        .id = id,
        .label = std::move(label),
        .parents = std::move(parents),
        .operation = std::move(operation),
    });
    last_id_ = id;
    return {};
}

auto ValueGraph::next_id() const -> ValueId {
    std::shared_lock lock(mutex_);
    return nodes_.empty() ? 1 : last_id_ + 1;
}

auto ValueGraph::contains(ValueId id) const -> bool {
    std::shared_lock lock(mutex_);
    return nodes_.contains(id);
}

auto ValueGraph::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return nodes_.size();
}

void ValueGraph::reset() {
    std::unique_lock lock(mutex_);
    nodes_.clear();
    last_id_ = 0;
}

ValueGraph::ReadView::ReadView(const ValueGraph& graph)
    : graph_(graph)
    , lock_(graph.mutex_)
{
}

auto ValueGraph::ReadView::find(ValueId id) const -> const ValueNode* {
    auto it = graph_.nodes_.find(id);
    if (it == graph_.nodes_.end()) return nullptr;
    return &it->second;
}

} // namespace flowgate::graph
