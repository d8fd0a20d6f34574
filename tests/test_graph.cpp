#include "arbor_test_utils.hpp"

using namespace arbor;
using namespace arbor::testing;
using graph::OpKind;

// ============================================================================
// Type inference
// ============================================================================

TEST(GraphIR, BinaryOpsPromoteAndBroadcastRank) {
    auto a = input("a", DType::Int32, 2);
    auto b = input("b", DType::Float32, 1);
    auto c = a + b;
    EXPECT_EQ(c.dtype(), DType::Float64);
    EXPECT_EQ(c.ndim(), 2u);

    auto i = input("i", DType::Int64, 1);
    EXPECT_EQ((i / i).dtype(), DType::Float64);
    EXPECT_EQ(int_div(i, i).dtype(), DType::Int64);
    EXPECT_EQ((i < i).dtype(), DType::Bool);
}

TEST(GraphIR, TranscendentalOpsOnIntegersProduceFloat64) {
    auto i = input("i", DType::Int32, 1);
    EXPECT_EQ(exp(i).dtype(), DType::Float64);
    EXPECT_EQ(sqrt(i).dtype(), DType::Float64);
    EXPECT_EQ(neg(i).dtype(), DType::Int32);

    auto f = input("f", DType::Float32, 1);
    EXPECT_EQ(tanh(f).dtype(), DType::Float32);
}

TEST(GraphIR, ScalarOperandsKeepVariableDtypeWhenExact) {
    auto f = input("f", DType::Float32, 1);
    EXPECT_EQ((f * 2.0).dtype(), DType::Float32);

    auto i = input("i", DType::Int32, 1);
    EXPECT_EQ((i + 1.0).dtype(), DType::Int32);
    EXPECT_EQ((i + 0.5).dtype(), DType::Float64);
}

TEST(GraphIR, LogicalOpsRequireBool) {
    auto x = input("x", DType::Float64, 1);
    auto b = x > 0.0;
    EXPECT_EQ(logical_and(b, b).dtype(), DType::Bool);
    EXPECT_THROW(logical_and(x, b), TypeShapeError);
    EXPECT_THROW(logical_not(x), TypeShapeError);
    EXPECT_THROW(switch_(x, x, x), TypeShapeError);
}

TEST(GraphIR, ReductionTypes) {
    auto m = input("m", DType::Int32, 2);
    EXPECT_EQ(sum(m).ndim(), 0u);
    EXPECT_EQ(sum(m).dtype(), DType::Int64);
    EXPECT_EQ(sum(m, {0}).ndim(), 1u);
    EXPECT_EQ(sum(m, {-1}, true).ndim(), 2u);
    EXPECT_EQ(mean(m, {1}).dtype(), DType::Float64);
    EXPECT_EQ(max(m).dtype(), DType::Int32);
    EXPECT_THROW(sum(m, {2}), TypeShapeError);
}

TEST(GraphIR, DotRanks) {
    auto v = input("v", DType::Float64, 1);
    auto m = input("m", DType::Float64, 2);
    EXPECT_EQ(dot(v, v).ndim(), 0u);
    EXPECT_EQ(dot(m, v).ndim(), 1u);
    EXPECT_EQ(dot(v, m).ndim(), 1u);
    EXPECT_EQ(dot(m, m).ndim(), 2u);
    auto t = input("t", DType::Float64, 3);
    EXPECT_THROW(dot(t, v), TypeShapeError);
}

TEST(GraphIR, StructuralOpsDeclareViews) {
    auto m = input("m", DType::Float64, 2);
    auto row = subtensor(m, 0, -1);
    EXPECT_EQ(row.ndim(), 1u);
    EXPECT_EQ(row.node()->viewed_input(0), std::optional<size_t>(0));

    auto t = transpose(m);
    EXPECT_EQ(t.op(), OpKind::Dimshuffle);
    EXPECT_TRUE(t.node()->viewed_input(0).has_value());

    EXPECT_THROW(reshape(m, {-1, -1}), ValueError);
    EXPECT_THROW(dimshuffle(m, {0, 0}), ValueError);
}

TEST(GraphIR, SetSubtensorNeedsARegion) {
    auto m = input("m", DType::Float64, 2);
    auto y = input("y", DType::Float64, 1);
    auto updated = set_subtensor(subtensor(m, 0, 0), y);
    EXPECT_EQ(updated.type(), m.type());
    EXPECT_EQ(updated.node()->inputs()[0], m);
    EXPECT_THROW(set_subtensor(m, y), TypeShapeError);
}

TEST(GraphIR, LeavesAreDistinctVariables) {
    auto c = constant(3.0);
    EXPECT_TRUE(c.is_constant());
    EXPECT_TRUE(c.is_leaf());

    auto s = shared(Vec({1, 2}), "s");
    EXPECT_TRUE(s.is_shared());
    EXPECT_EQ(s.name(), "s");
    EXPECT_EQ(s.type(), (TensorType{DType::Float64, 1}));
    EXPECT_THROW(graph::SharedVariable{c}, ValueError);
}

TEST(GraphIR, NamedProducesNewNonLeafVariable) {
    auto x = input("x", DType::Float64, 1);
    auto y = (x + 1.0).named("y");
    EXPECT_EQ(y.name(), "y");
    EXPECT_EQ(y.str(), "y");
}

// ============================================================================
// Graph construction
// ============================================================================

TEST(Graph, NodesAreTopologicallyOrdered) {
    auto x = input("x", DType::Float64, 1);
    auto y = input("y", DType::Float64, 1);
    auto z = exp(x * y) + y;
    graph::Graph g({x, y}, {z});

    for (const auto &node : g.nodes()) {
        for (const auto &in : node->inputs())
            EXPECT_LT(g.position(in.node().get()), g.position(node.get()));
    }
    EXPECT_EQ(g.apply_nodes().size(), 3u);
    EXPECT_EQ(g.clients(y).size(), 2u);
    EXPECT_TRUE(g.is_output(z));
}

TEST(Graph, UndeclaredInputThrowsMissingInputError) {
    auto x = input("x", DType::Float64, 1);
    auto y = input("y", DType::Float64, 1);
    EXPECT_THROW(graph::Graph({x}, {x + y}), MissingInputError);
}

TEST(Graph, RejectsNonInputDeclarationsAndDuplicates) {
    auto x = input("x", DType::Float64, 1);
    EXPECT_THROW(graph::Graph({x + 1.0}, {x}), ValueError);
    EXPECT_THROW(graph::Graph({x, x}, {x}), ValueError);
}

TEST(Graph, SharedVariablesAreCollected) {
    auto x = input("x", DType::Float64, 1);
    auto w = shared(Vec({1, 2}), "w");
    graph::Graph g({x}, {x * w});
    auto vars = g.shared_variables();
    ASSERT_EQ(vars.size(), 1u);
    EXPECT_EQ(vars[0], w);
}

TEST(Graph, CloneReplaceRebuildsDependents) {
    auto x = input("x", DType::Float64, 1);
    auto y = input("y", DType::Float64, 1);
    auto z = (x + 1.0) * 2.0;

    graph::VariableMap repl;
    repl[x] = y;
    auto outs = graph::clone_replace({z}, repl);
    ASSERT_EQ(outs.size(), 1u);
    EXPECT_NE(outs[0], z);
    graph::Graph g({y}, outs);
    EXPECT_EQ(g.inputs().size(), 1u);

    graph::VariableMap bad;
    bad[x] = input("i", DType::Int64, 1);
    EXPECT_THROW(graph::clone_replace({z}, bad), TypeShapeError);
}

TEST(Graph, ValidateRejectsDestroyedLeaf) {
    auto x = input("x", DType::Float64, 1);
    auto y = x + 1.0;
    auto destroyer = y.node()->with_destroy_map({{0, 0}});
    graph::Graph g({x}, {destroyer->output(0)});
    EXPECT_THROW(g.validate(), RuntimeError);
}

// ============================================================================
// Test values
// ============================================================================

TEST(TestValues, ComputedEagerlyWhenEnabled) {
    TestValueScope scope(TestValuePolicy::Raise);
    auto x = input("x", DType::Float64, 1, Vec({1, 2, 3}));
    auto y = x * 2.0 + 1.0;
    ASSERT_TRUE(y.test_value().has_value());
    ExpectTensorEquals<double>(*y.test_value(), {3, 5, 7});
}

TEST(TestValues, OffByDefault) {
    auto x = input("x", DType::Float64, 1, Vec({1, 2, 3}));
    auto y = x * 2.0;
    EXPECT_FALSE(y.test_value().has_value());
}

TEST(TestValues, RaisePolicySurfacesShapeErrors) {
    TestValueScope scope(TestValuePolicy::Raise);
    auto a = input("a", DType::Float64, 1, Vec({1, 2, 3}));
    auto b = input("b", DType::Float64, 1, Vec({1, 2}));
    EXPECT_THROW(a + b, TypeShapeError);
}

TEST(TestValues, IgnoreAndWarnPoliciesBuildTheNode) {
    auto a = input("a", DType::Float64, 1, Vec({1, 2, 3}));
    auto b = input("b", DType::Float64, 1, Vec({1, 2}));
    {
        TestValueScope scope(TestValuePolicy::Ignore);
        auto c = a + b;
        EXPECT_FALSE(c.test_value().has_value());
    }
    {
        TestValueScope scope(TestValuePolicy::Warn);
        auto c = a + b;
        EXPECT_FALSE(c.test_value().has_value());
    }
}

TEST(TestValues, MissingInputValueUnderRaise) {
    TestValueScope scope(TestValuePolicy::Raise);
    auto x = input("x", DType::Float64, 1);
    EXPECT_THROW(x + 1.0, TypeShapeError);
}

TEST(TestValues, ScopeRestoresPreviousPolicy) {
    EXPECT_EQ(current_test_value_policy(), TestValuePolicy::Off);
    {
        TestValueScope outer(TestValuePolicy::Warn);
        {
            TestValueScope inner(TestValuePolicy::Raise);
            EXPECT_EQ(current_test_value_policy(), TestValuePolicy::Raise);
        }
        EXPECT_EQ(current_test_value_policy(), TestValuePolicy::Warn);
    }
    EXPECT_EQ(current_test_value_policy(), TestValuePolicy::Off);
}
