#include "arbor/log.hpp"
#include "arbor/opt/optimizer.hpp"
#include "arbor/opt/rewrite.hpp"
#include "arbor/scan/scan_info.hpp"

#include <algorithm>

namespace arbor {
namespace opt {

// Optimizes every scan's inner graph with the outer pipeline, minus the
// passes that only make sense at the function boundary.
graph::Graph scan_inner(const graph::Graph &graph, const CompileConfig &config) {
    CompileConfig inner_config = config;
    std::vector<std::string> passes = pipeline(config);
    passes.erase(std::remove_if(passes.begin(), passes.end(),
                                [](const std::string &p) {
                                    return p == "inplace" || p == "output_guard";
                                }),
                 passes.end());
    inner_config.passes = passes;

    return rewrite_graph(
        graph,
        [&](const graph::NodePtr &node, const graph::Node &)
            -> std::optional<std::vector<graph::Variable>> {
            if (node->op() != graph::OpKind::Scan)
                return std::nullopt;
            const auto &info =
                graph::get_params<graph::ScanParams>(node->params()).info;
            if (!info->inner.applied_passes().empty())
                return std::nullopt;

            auto updated = std::make_shared<graph::ScanInfo>(*info);
            updated->inner = optimize(info->inner, inner_config);
            logging::logger()->debug(
                "scan_inner: scan '{}' inner graph {} -> {} apply nodes",
                info->name, info->inner.apply_nodes().size(),
                updated->inner.apply_nodes().size());

            graph::NodeDesc desc = node->desc();
            desc.params = graph::ScanParams{std::move(updated)};
            graph::NodePtr rebuilt = graph::Node::make(std::move(desc));
            std::vector<graph::Variable> outs;
            for (size_t i = 0; i < rebuilt->num_outputs(); ++i)
                outs.push_back(rebuilt->output(i));
            return outs;
        });
}

} // namespace opt
} // namespace arbor
