#include "arbor/log.hpp"
#include "arbor/opt/optimizer.hpp"
#include "arbor/opt/rewrite.hpp"
#include "arbor/scan/scan_info.hpp"

#include <algorithm>

namespace arbor {
namespace opt {

namespace {

// Every reader picks the last step: subtensor(history, axis 0, index -1).
bool only_last_step_read(const graph::Graph &graph, const graph::Variable &v) {
    const auto &clients = graph.clients(v);
    if (clients.empty())
        return false;
    for (const auto &c : clients) {
        if (c.is_output() || c.node->op() != graph::OpKind::Subtensor)
            return false;
        const auto &p =
            graph::get_params<graph::SubtensorParams>(c.node->params());
        if (p.axis != 0 || !p.is_index || p.index != -1)
            return false;
    }
    return true;
}

} // namespace

// Scan histories only read at their last step keep a rolling window of
// max(1, k) rows instead of k + n_steps.
graph::Graph scan_save_mem(const graph::Graph &graph) {
    return rewrite_graph(
        graph,
        [&](const graph::NodePtr &node, const graph::Node &original)
            -> std::optional<std::vector<graph::Variable>> {
            if (node->op() != graph::OpKind::Scan)
                return std::nullopt;
            const auto &info =
                graph::get_params<graph::ScanParams>(node->params()).info;

            std::vector<size_t> retention = info->retention;
            bool changed = false;
            for (size_t o = 0; o < info->n_outputs(); ++o) {
                if (retention[o] > 0 || graph.is_output(original.output(o)) ||
                    !only_last_step_read(graph, original.output(o)))
                    continue;
                retention[o] = std::max<size_t>(1, info->max_lookback(o));
                changed = true;
                logging::logger()->debug(
                    "scan_save_mem: scan '{}' output {} keeps {} rows",
                    info->name, o, retention[o]);
            }
            if (!changed)
                return std::nullopt;

            auto updated = std::make_shared<graph::ScanInfo>(*info);
            updated->retention = std::move(retention);
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
