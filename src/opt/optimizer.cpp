#include "arbor/opt/optimizer.hpp"
#include "arbor/error.hpp"
#include "arbor/log.hpp"

#include <algorithm>

namespace arbor {
namespace opt {

namespace {

template <graph::Graph (*Pass)(const graph::Graph &)>
graph::Graph ignore_config(const graph::Graph &graph, const CompileConfig &) {
    return Pass(graph);
}

std::vector<PassInfo> build_registry() {
    return {
        {"constant_folding", &ignore_config<constant_folding>, {"inplace"}},
        {"algebraic_simplify", &ignore_config<algebraic_simplify>, {"inplace"}},
        {"merge", &ignore_config<merge>, {"inplace"}},
        {"scan_save_mem", &ignore_config<scan_save_mem>, {"inplace"}},
        {"scan_inner", &scan_inner, {"inplace"}},
        {"elemwise_fusion",
         &ignore_config<elemwise_fusion>,
         {"inplace", "output_guard"}},
        {"inplace", &ignore_config<inplace>, {"output_guard"}},
        {"output_guard", &ignore_config<output_guard>, {}},
    };
}

} // namespace

const std::vector<PassInfo> &PassRegistry::all() {
    static const std::vector<PassInfo> passes = build_registry();
    return passes;
}

bool PassRegistry::contains(const std::string &name) {
    const auto &passes = all();
    return std::any_of(passes.begin(), passes.end(),
                       [&](const PassInfo &p) { return p.name == name; });
}

const PassInfo &PassRegistry::get(const std::string &name) {
    for (const auto &p : all()) {
        if (p.name == name)
            return p;
    }
    throw ValueError("unknown optimization pass '" + name + "'");
}

std::vector<std::string> pipeline(const CompileConfig &config) {
    std::vector<std::string> names;
    if (config.passes) {
        names = *config.passes;
    } else {
        switch (config.optimization_level) {
        case 0:
            names = {"output_guard"};
            break;
        case 1:
            names = {"constant_folding", "merge", "output_guard"};
            break;
        default:
            for (const auto &p : PassRegistry::all())
                names.push_back(p.name);
            break;
        }
    }
    if (!config.inplace_enabled)
        names.erase(std::remove(names.begin(), names.end(), "inplace"),
                    names.end());
    return names;
}

graph::Graph apply_pass(const graph::Graph &graph, const std::string &name,
                        const CompileConfig &config) {
    const PassInfo &pass = PassRegistry::get(name);
    for (const auto &other : pass.forbidden_after) {
        if (graph.has_applied(other))
            throw OptimizationPreconditionError::must_run_before(name, other);
    }
    graph::Graph result = pass.run(graph, config);
    return result.with_pass(name);
}

graph::Graph optimize(const graph::Graph &graph, const CompileConfig &config) {
    graph::Graph current = graph;
    for (const auto &name : pipeline(config)) {
        size_t before = current.apply_nodes().size();
        current = apply_pass(current, name, config);
        logging::logger()->debug("pass {}: {} -> {} apply nodes", name, before,
                                 current.apply_nodes().size());
    }
    current.validate();
    return current;
}

} // namespace opt
} // namespace arbor
