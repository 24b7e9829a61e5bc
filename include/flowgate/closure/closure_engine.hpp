#pragma once

#include <cstddef>
#include <expected>
#include <string_view>
#include <unordered_map>

#include "flowgate/core/types.hpp"
#include "flowgate/graph/value_graph.hpp"
#include "flowgate/labels/label.hpp"

namespace flowgate::closure {

enum class ClosureError {
    BudgetExceeded,  // more than max_closure_steps nodes would be visited
    UnknownValue,    // the queried value is not in the graph
};

auto closure_error_to_string(ClosureError error) -> std::string_view;

/// Join of a value's own label with every ancestor label.
struct LabelClosure {
    labels::IntegrityLabel integrity = labels::IntegrityLabel::untrusted();
    labels::ConfidentialityLabel confidentiality;
    std::size_t visited = 0;

    /// Label assumed when a closure cannot be computed: Untrusted integrity
    /// and every confidentiality tag. Never "clean".
    [[nodiscard]] static auto worst_case() -> LabelClosure;
};

using ClosureResult = std::expected<LabelClosure, ClosureError>;

/// Computes label closures over a ValueGraph for one evaluation call.
///
/// Create one engine per evaluation: results are memoised for the engine's
/// lifetime so that a value queried twice is traversed once, and discarding
/// the engine afterwards keeps results from going stale as the graph grows.
class ClosureEngine {
public:
    ClosureEngine(const graph::ValueGraph& graph, std::size_t max_closure_steps);

    /// Breadth-first join over parent edges. Visiting more than
    /// max_closure_steps distinct nodes is a hard BudgetExceeded failure.
    [[nodiscard]] auto closure_of(ValueId id) -> ClosureResult;

    [[nodiscard]] auto memo_size() const noexcept -> std::size_t { return memo_.size(); }

private:
    auto compute(ValueId id) const -> ClosureResult;

    const graph::ValueGraph& graph_;
    std::size_t max_steps_;
    std::unordered_map<ValueId, ClosureResult> memo_;
};

} // namespace flowgate::closure
