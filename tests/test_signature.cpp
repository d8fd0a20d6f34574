#include "arbor_test_utils.hpp"

#include <unordered_map>

using namespace arbor;
using namespace arbor::testing;

namespace {

graph::Graph BuildAffine(double scale) {
    auto x = input("x", DType::Float64, 1);
    auto b = input("b", DType::Float64, 1);
    return graph::Graph({x, b}, {tanh(x * scale + b)});
}

} // namespace

TEST(GraphSignature, Deterministic) {
    auto g = BuildAffine(2.0);
    EXPECT_EQ(g.signature(), g.signature());
}

TEST(GraphSignature, IndependentOfNodeIdsAndNames) {
    auto g1 = BuildAffine(2.0);
    auto g2 = BuildAffine(2.0);
    EXPECT_EQ(g1.signature(), g2.signature());
}

TEST(GraphSignature, ConstantValuesContribute) {
    EXPECT_NE(BuildAffine(2.0).signature(), BuildAffine(3.0).signature());
}

TEST(GraphSignature, OpsAndTypesContribute) {
    auto x = input("x", DType::Float64, 1);
    auto xf = input("x", DType::Float32, 1);
    auto m = input("x", DType::Float64, 2);

    auto s_exp = graph::Graph({x}, {exp(x)}).signature();
    auto s_log = graph::Graph({x}, {log(x)}).signature();
    auto s_f32 = graph::Graph({xf}, {exp(xf)}).signature();
    auto s_mat = graph::Graph({m}, {exp(m)}).signature();
    EXPECT_NE(s_exp, s_log);
    EXPECT_NE(s_exp, s_f32);
    EXPECT_NE(s_exp, s_mat);
}

TEST(GraphSignature, EdgesContribute) {
    auto a = input("a", DType::Float64, 1);
    auto b = input("b", DType::Float64, 1);
    auto s1 = graph::Graph({a, b}, {a - b}).signature();
    auto s2 = graph::Graph({a, b}, {b - a}).signature();
    EXPECT_NE(s1, s2);
}

TEST(GraphSignature, UsableAsHashKey) {
    std::unordered_map<graph::GraphSignature, int, graph::GraphSignatureHash>
        cache;
    cache[BuildAffine(2.0).signature()] = 1;
    EXPECT_EQ(cache.count(BuildAffine(2.0).signature()), 1u);
    EXPECT_EQ(cache.count(BuildAffine(5.0).signature()), 0u);
}
