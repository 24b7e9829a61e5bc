#include "flowgate/closure/closure_engine.hpp"

#include <deque>
#include <unordered_set>

#include "flowgate/core/logger.hpp"

namespace flowgate::closure {

auto closure_error_to_string(ClosureError error) -> std::string_view {
    switch (error) {
        case ClosureError::BudgetExceeded: return "budget_exceeded";
        case ClosureError::UnknownValue: return "unknown_value";
    }
    return "unknown";
}

auto LabelClosure::worst_case() -> LabelClosure {
    return LabelClosure{
        .integrity = labels::IntegrityLabel::untrusted(),
        .confidentiality = labels::ConfidentialityLabel::saturated(),
        .visited = 0,
    };
}

ClosureEngine::ClosureEngine(const graph::ValueGraph& graph, std::size_t max_closure_steps)
    : graph_(graph)
    , max_steps_(max_closure_steps)
{
}

auto ClosureEngine::closure_of(ValueId id) -> ClosureResult {
    if (auto it = memo_.find(id); it != memo_.end()) {
        return it->second;
    }
    auto result = compute(id);
    memo_.emplace(id, result);
    return result;
}

auto ClosureEngine::compute(ValueId id) const -> ClosureResult {
    auto view = graph_.read();

    const auto* root = view.find(id);
    if (!root) {
        return std::unexpected(ClosureError::UnknownValue);
    }

    std::deque<const graph::ValueNode*> frontier{root};
    std::unordered_set<ValueId> seen{id};

    LabelClosure closure;
    closure.integrity = root->label.integrity;
    bool first = true;

    while (!frontier.empty()) {
        // The budget is checked before each visit, not once at the end.
        if (closure.visited >= max_steps_) {
            LOG_WARN("Closure of value {} exceeded {} steps", id, max_steps_);
            return std::unexpected(ClosureError::BudgetExceeded);
        }

        const auto* node = frontier.front();
        frontier.pop_front();
        ++closure.visited;

        if (first) {
            closure.confidentiality = node->label.confidentiality;
            first = false;
        } else {
            closure.integrity = labels::join(closure.integrity, node->label.integrity);
            closure.confidentiality =
                labels::join(closure.confidentiality, node->label.confidentiality);
        }

        for (auto parent_id : node->parents) {
            if (!seen.insert(parent_id).second) continue;
            const auto* parent = view.find(parent_id);
            if (!parent) {
                // Edges are validated on insert; a dangling one means the
                // graph was reset underneath us.
                return std::unexpected(ClosureError::UnknownValue);
            }
            frontier.push_back(parent);
        }
    }

    LOG_TRACE("Closure of value {}: integrity={} visited={}", id,
              closure.integrity.to_string(), closure.visited);
    return closure;
}

} // namespace flowgate::closure
