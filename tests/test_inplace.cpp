#include "arbor_test_utils.hpp"

#include "arbor/opt/alias_analysis.hpp"
#include "arbor/opt/optimizer.hpp"

using namespace arbor;
using namespace arbor::testing;
using graph::OpKind;

namespace {

graph::Graph Inplace(const graph::Graph &g) {
    return opt::apply_pass(g, "inplace", CompileConfig());
}

const graph::Node *FindOp(const graph::Graph &g, OpKind op) {
    for (const auto &node : g.apply_nodes()) {
        if (node->op() == op)
            return node.get();
    }
    return nullptr;
}

bool HasOrdering(const graph::Graph &g, OpKind before, OpKind after) {
    for (const auto &e : g.orderings()) {
        if (e.before->op() == before && e.after->op() == after)
            return true;
    }
    return false;
}

} // namespace

// ============================================================================
// Alias analysis
// ============================================================================

TEST(AliasAnalysis, ViewsShareTheirSourceRoot) {
    auto m = input("m", DType::Float64, 2);
    auto t = m * 2.0;
    auto row = subtensor(t, 0, 0);
    auto tt = transpose(t);
    graph::Graph g({m}, {row, tt, t + 1.0});

    opt::AliasAnalysis alias(g);
    EXPECT_EQ(alias.root(row), t);
    EXPECT_EQ(alias.root(tt), t);
    EXPECT_EQ(alias.members(t).size(), 3u);
    EXPECT_TRUE(alias.reaches_output(t));
    EXPECT_FALSE(alias.is_leaf_class(t));
    EXPECT_TRUE(alias.is_leaf_class(alias.root(m)));
    EXPECT_EQ(alias.readers(t).size(), 3u);
    EXPECT_EQ(alias.destroyer(t), nullptr);
}

// ============================================================================
// Safety rule
// ============================================================================

TEST(Inplace, SingleReaderIntermediateIsDestroyed) {
    auto x = input("x", DType::Float64, 1);
    auto g = Inplace(graph::Graph({x}, {exp(x * 2.0)}));
    const auto *e = FindOp(g, OpKind::Exp);
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->destroyed_input(0), std::optional<size_t>(0));
    EXPECT_NO_THROW(g.validate());
}

TEST(Inplace, LeavesAreNeverDestroyed) {
    auto x = input("x", DType::Float64, 1);
    auto s = shared(Vec({1, 2, 3}), "s");
    auto g = Inplace(graph::Graph({x}, {x + s, constant(Vec({1, 1, 1})) * x}));
    for (const auto &node : g.apply_nodes())
        EXPECT_TRUE(node->destroy_map().empty()) << node->str();
}

TEST(Inplace, OutputsAndTheirViewsAreNotDestroyed) {
    auto m = input("m", DType::Float64, 2);
    auto t = m * 2.0;
    auto g1 = Inplace(graph::Graph({m}, {t, exp(t)}));
    EXPECT_TRUE(FindOp(g1, OpKind::Exp)->destroy_map().empty());

    auto t2 = m * 3.0;
    auto g2 = Inplace(graph::Graph({m}, {subtensor(t2, 0, 0), exp(t2)}));
    EXPECT_TRUE(FindOp(g2, OpKind::Exp)->destroy_map().empty());
}

TEST(Inplace, OtherReadersAreOrderedFirst) {
    auto x = input("x", DType::Float64, 1);
    auto t = x * 2.0;
    auto g = Inplace(graph::Graph({x}, {exp(t), t + 1.0}));

    const auto *e = FindOp(g, OpKind::Exp);
    const auto *a = FindOp(g, OpKind::Add);
    ASSERT_TRUE(e && a);
    EXPECT_TRUE(e->destroyed_input(0).has_value());
    EXPECT_TRUE(a->destroy_map().empty());
    EXPECT_TRUE(HasOrdering(g, OpKind::Add, OpKind::Exp));
    EXPECT_LT(g.position(a), g.position(e));
    EXPECT_NO_THROW(g.validate());
}

TEST(Inplace, DestroyerMayNotPrecedeAnotherReader) {
    // exp(t) feeds the add that also reads t, so exp cannot overwrite t;
    // the add can, once exp has run.
    auto x = input("x", DType::Float64, 1);
    auto t = x * 2.0;
    auto g = Inplace(graph::Graph({x}, {t + exp(t)}));

    EXPECT_TRUE(FindOp(g, OpKind::Exp)->destroy_map().empty());
    const auto *a = FindOp(g, OpKind::Add);
    EXPECT_EQ(a->destroyed_input(0), std::optional<size_t>(0));
    EXPECT_NO_THROW(g.validate());
}

TEST(Inplace, OnlyOneDestroyerPerBuffer) {
    auto x = input("x", DType::Float64, 1);
    auto t = x * 2.0;
    auto g = Inplace(graph::Graph({x}, {exp(t), sqrt(t), tanh(t)}));
    size_t destroyers = 0;
    for (const auto &node : g.apply_nodes())
        destroyers += !node->destroy_map().empty();
    EXPECT_EQ(destroyers, 1u);
    EXPECT_EQ(g.orderings().size(), 2u);
}

TEST(Inplace, AliasedSecondOperandBlocksDestroy) {
    auto m = input("m", DType::Float64, 2);
    auto t = m * 2.0;
    auto g = Inplace(graph::Graph({m}, {t + subtensor(t, 0, 0)}));
    EXPECT_TRUE(FindOp(g, OpKind::Add)->destroy_map().empty());
}

TEST(Inplace, IdenticalOperandsMayBeDestroyed) {
    auto x = input("x", DType::Float64, 1);
    auto t = x * 2.0;
    auto g = Inplace(graph::Graph({x}, {t + t}));
    EXPECT_TRUE(FindOp(g, OpKind::Add)->destroyed_input(0).has_value());
}

TEST(Inplace, SetSubtensorDestroysOnlyItsTarget) {
    auto v = input("v", DType::Float64, 1);
    auto y = input("y", DType::Float64, 0);
    auto t = v * 2.0;
    auto g = Inplace(graph::Graph({v, y}, {set_subtensor(subtensor(t, 0, 0), y * 3.0)}));
    const auto *s = FindOp(g, OpKind::SetSubtensor);
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->destroyed_input(0), std::optional<size_t>(0));
}

// ============================================================================
// Execution with in-place nodes
// ============================================================================

class InplaceExecution : public ModeTest {};

TEST_P(InplaceExecution, MultiConsumerGraphKeepsValues) {
    auto x = input("x", DType::Float64, 1);
    auto t = x * 2.0;
    auto a = exp(t);
    auto b = t + 1.0;
    auto c = t + exp(t * 0.5);
    auto d = t + t;

    auto f = function({x}, {a, b, c, d}, {}, config());
    auto ref = function({x}, {a, b, c, d}, {},
                        ConfigFor(ExecutionMode::Interpreted, 0));

    auto arg = Vec({0.0, 0.5, -1.0});
    auto expected = ref({arg});
    auto actual = f({arg});
    for (size_t i = 0; i < expected.size(); ++i)
        ExpectTensorsClose(actual[i], expected[i], 1e-12, 1e-12);
    ExpectTensorEquals<double>(arg, {0.0, 0.5, -1.0});
}

TEST_P(InplaceExecution, BroadcastDestroyedInputFallsBackToFreshBuffer) {
    auto x = input("x", DType::Float64, 1);
    auto y = input("y", DType::Float64, 1);
    auto t = x * 2.0;
    CompileConfig c = config();
    c.passes = std::vector<std::string>{"inplace", "output_guard"};
    auto f = function({x, y}, {exp(t + y)}, {}, c);
    EXPECT_FALSE(f.graph().apply_nodes().back()->destroy_map().empty());

    auto r = f({Vec({1.0}), Vec({0.0, 1.0, 2.0})});
    ExpectTensorEquals<double>(r[0], {std::exp(2.0), std::exp(3.0), std::exp(4.0)},
                               1e-9);
}

TEST_P(InplaceExecution, ReportsInplaceNodes) {
    auto x = input("x", DType::Float64, 1);
    auto t = x * 2.0;
    auto f = function({x}, {exp(t), t + 1.0}, {}, config());

    bool any_inplace = false;
    f.set_node_callback([&](const profile::NodeEvent &e) {
        any_inplace |= e.inplace;
    });
    f({Vec({1.0, 2.0})});
    EXPECT_TRUE(any_inplace);

    CompileConfig off = config();
    off.inplace_enabled = false;
    auto g = function({x}, {exp(t), t + 1.0}, {}, off);
    for (const auto &node : g.graph().apply_nodes())
        EXPECT_TRUE(node->destroy_map().empty());
}

INSTANTIATE_TEST_SUITE_P(AllModes, InplaceExecution,
                         ::testing::ValuesIn(AllModes()), ModeName);
