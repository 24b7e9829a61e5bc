#include "flowgate/witness/witness.hpp"

#include <algorithm>

#include "flowgate/core/logger.hpp"

namespace flowgate::witness {

void to_json(json& j, const WitnessNode& node) {
    j = json{{"id", node.id}};
    if (node.missing) {
        j["missing"] = true;
        return;
    }
    j["integrity"] = node.integrity;
    j["confidentiality"] = node.confidentiality;
    j["operation"] = node.operation;
    if (node.repeated) j["repeated"] = true;
    if (node.truncated) j["truncated"] = true;
    if (!node.parents.empty()) j["parents"] = node.parents;
}

void to_json(json& j, const WitnessRoot& root) {
    j = json{{"argument", root.argument}, {"value", root.node}};
}

void to_json(json& j, const Witness& witness) {
    j = json{
        {"roots", witness.roots},
        {"max_depth", witness.max_depth},
        {"truncated", witness.truncated},
    };
}

WitnessBuilder::WitnessBuilder(const graph::ValueGraph& graph, std::size_t max_depth)
    : graph_(graph)
    , max_depth_(std::min(max_depth, kMaxWitnessDepth))
{
}

auto WitnessBuilder::build(const std::vector<std::pair<std::string, ValueId>>& roots)
    -> Witness {
    expanded_.clear();
    truncated_ = false;

    auto view = graph_.read();
    Witness witness;
    witness.max_depth = max_depth_;
    for (const auto& [argument, id] : roots) {
        witness.roots.push_back(WitnessRoot{.argument = argument, .node = visit(view, id, 0)});
    }
    witness.truncated = truncated_;
    if (truncated_) {
        LOG_DEBUG("Witness truncated at depth {}", max_depth_);
    }
    return witness;
}

auto WitnessBuilder::visit(const graph::ValueGraph::ReadView& view, ValueId id,
                           std::size_t depth) -> WitnessNode {
    WitnessNode out;
    out.id = id;

    const auto* node = view.find(id);
    if (!node) {
        out.missing = true;
        return out;
    }

    out.integrity = node->label.integrity.to_string();
    out.confidentiality = node->label.confidentiality.tag_names();
    out.operation = node->operation;

    if (node->parents.empty()) return out;

    if (expanded_.contains(id)) {
        out.repeated = true;
        return out;
    }
    if (depth >= max_depth_) {
        out.truncated = true;
        truncated_ = true;
        return out;
    }
    expanded_.insert(id);

    out.parents.reserve(node->parents.size());
    for (auto parent : node->parents) {
        out.parents.push_back(visit(view, parent, depth + 1));
    }
    return out;
}

} // namespace flowgate::witness
