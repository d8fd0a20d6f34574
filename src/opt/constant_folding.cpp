#include "arbor/error.hpp"
#include "arbor/exec/kernels.hpp"
#include "arbor/log.hpp"
#include "arbor/ops.hpp"
#include "arbor/opt/optimizer.hpp"
#include "arbor/opt/rewrite.hpp"

namespace arbor {
namespace opt {

namespace {

bool foldable(const graph::Node &node) {
    switch (node.op()) {
    case graph::OpKind::Scan:
    case graph::OpKind::DeepCopy:
        return false;
    default:
        break;
    }
    if (node.inputs().empty())
        return false;
    for (const auto &in : node.inputs()) {
        if (!in.is_constant())
            return false;
    }
    return true;
}

} // namespace

// Replaces apply nodes whose inputs are all constants by their value.
// Evaluation errors leave the node for run time, where they surface with
// the real inputs.
graph::Graph constant_folding(const graph::Graph &graph) {
    size_t folded = 0;
    graph::Graph result = rewrite_graph(
        graph,
        [&](const graph::NodePtr &node, const graph::Node &)
            -> std::optional<std::vector<graph::Variable>> {
            if (node->is_leaf() || !foldable(*node))
                return std::nullopt;

            std::vector<Tensor> args;
            for (const auto &in : node->inputs())
                args.push_back(graph::get_params<graph::ConstantParams>(
                                   in.node()->params())
                                   .value);

            exec::KernelOptions options;
            options.allow_inplace = false;
            std::vector<Tensor> values;
            try {
                values = exec::run_kernel(*node, args, options).outputs;
            } catch (const ArborError &e) {
                logging::logger()->debug("constant_folding: keeping {}: {}",
                                         node->str(), e.what());
                return std::nullopt;
            }

            std::vector<graph::Variable> outs;
            for (size_t i = 0; i < values.size(); ++i) {
                if (values[i].size() > CONSTANT_FOLDING_MAX_ELEMENTS)
                    return std::nullopt;
                outs.push_back(constant(values[i], node->output_name(i)));
            }
            logging::logger()->debug("constant_folding: {}", node->str());
            ++folded;
            return outs;
        });
    if (folded)
        logging::logger()->debug("constant_folding: folded {} nodes", folded);
    return result;
}

} // namespace opt
} // namespace arbor
