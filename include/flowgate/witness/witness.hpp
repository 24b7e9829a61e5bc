#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "flowgate/core/types.hpp"
#include "flowgate/graph/value_graph.hpp"

namespace flowgate::witness {

/// Hard ceiling on witness depth, whatever the policy asks for.
inline constexpr std::size_t kMaxWitnessDepth = 256;

/// One value in a provenance trace. Carries references and label bits only,
/// never the value's content.
struct WitnessNode {
    ValueId id = 0;
    std::string integrity;
    std::vector<std::string> confidentiality;
    std::string operation;
    std::vector<WitnessNode> parents;
    bool truncated = false;  // has parents that were cut at max depth
    bool repeated = false;   // expanded elsewhere in this witness
    bool missing = false;    // not present in the value graph
};

struct WitnessRoot {
    std::string argument;
    WitnessNode node;
};

struct Witness {
    std::vector<WitnessRoot> roots;
    std::size_t max_depth = 0;
    bool truncated = false;  // true if any node was cut
};

void to_json(json& j, const WitnessNode& node);
void to_json(json& j, const WitnessRoot& root);
void to_json(json& j, const Witness& witness);

/// Renders provenance trees rooted at call arguments.
///
/// Each value is expanded at most once per witness; later occurrences are
/// emitted as `repeated` leaves. Nodes at max_depth that still have parents
/// are emitted as `truncated` leaves.
class WitnessBuilder {
public:
    WitnessBuilder(const graph::ValueGraph& graph, std::size_t max_depth);

    [[nodiscard]] auto build(const std::vector<std::pair<std::string, ValueId>>& roots) -> Witness;

private:
    auto visit(const graph::ValueGraph::ReadView& view, ValueId id, std::size_t depth)
        -> WitnessNode;

    const graph::ValueGraph& graph_;
    std::size_t max_depth_;
    std::unordered_set<ValueId> expanded_;
    bool truncated_ = false;
};

} // namespace flowgate::witness
