#pragma once

#include <cstddef>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "flowgate/core/error.hpp"
#include "flowgate/core/types.hpp"
#include "flowgate/labels/label.hpp"

namespace flowgate::graph {

struct GraphBudgets {
    std::size_t max_values = 100000;
    std::size_t max_parents_per_value = 64;
};

/// One runtime value: its own label, the values it was derived from (in
/// edge creation order) and the kind of operation that produced it.
struct ValueNode {
    ValueId id = 0;
    labels::Label label;
    std::vector<ValueId> parents;
    std::string operation;
};

/// Append-only dependency graph of the values of one execution.
///
/// Single writer (the host emits values in order), any number of readers.
/// Nodes are immutable once inserted.
class ValueGraph {
public:
    explicit ValueGraph(GraphBudgets budgets);

    ValueGraph(const ValueGraph&) = delete;
    ValueGraph& operator=(const ValueGraph&) = delete;

    /// Inserts a value. IDs must be strictly increasing and every parent must
    /// already exist, which makes a cycle impossible to express.
    ///
    /// Fails with BudgetExceeded when max_values or max_parents_per_value
    /// would be exceeded, NotFound for an unknown parent, InvalidArgument for
    /// a non-increasing ID or a repeated parent.
    auto insert(ValueId id, labels::Label label, std::vector<ValueId> parents,
                std::string operation = {}) -> VoidResult;

    /// Next ID that insert() would accept as the smallest valid choice.
    [[nodiscard]] auto next_id() const -> ValueId;

    [[nodiscard]] auto contains(ValueId id) const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto budgets() const noexcept -> const GraphBudgets& { return budgets_; }

    /// Drops every value. IDs may be reused afterwards.
    void reset();

    /// Shared-lock view for multi-node traversals. Pointers returned by
    /// find() stay valid while the view is alive.
    class ReadView {
    public:
        explicit ReadView(const ValueGraph& graph);

        [[nodiscard]] auto find(ValueId id) const -> const ValueNode*;

    private:
        const ValueGraph& graph_;
        std::shared_lock<std::shared_mutex> lock_;
    };

    [[nodiscard]] auto read() const -> ReadView { return ReadView(*this); }

private:
    GraphBudgets budgets_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<ValueId, ValueNode> nodes_;
    ValueId last_id_ = 0;
};

} // namespace flowgate::graph
