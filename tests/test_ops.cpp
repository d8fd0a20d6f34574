#include "arbor_test_utils.hpp"

using namespace arbor;
using namespace arbor::testing;

namespace {

// Runs the reference interpreter on an unoptimized graph
Tensor Eval1(const std::vector<Variable> &inputs, const Variable &output,
             const std::vector<Tensor> &args) {
    auto f = function(inputs, {output}, {},
                      ConfigFor(ExecutionMode::Interpreted, 0));
    return f(args)[0];
}

} // namespace

// ============================================================================
// Elementwise
// ============================================================================

TEST(Ops, ArithmeticBroadcasts) {
    auto m = input("m", DType::Float64, 2);
    auto v = input("v", DType::Float64, 1);
    auto r = Eval1({m, v}, m * v + 1.0,
                   {Mat({1, 2, 3, 4, 5, 6}, 2, 3), Vec({10, 20, 30})});
    EXPECT_EQ(r.shape(), (Shape{2, 3}));
    ExpectTensorEquals<double>(r, {11, 41, 91, 41, 101, 181});
}

TEST(Ops, IncompatibleShapesFailAtRunTime) {
    auto a = input("a", DType::Float64, 1);
    auto b = input("b", DType::Float64, 1);
    EXPECT_THROW(Eval1({a, b}, a + b, {Vec({1, 2, 3}), Vec({1, 2})}),
                 ShapeError);
}

TEST(Ops, IntegerDivisionFloorsLikePython) {
    auto a = input("a", DType::Int64, 1);
    auto b = input("b", DType::Int64, 1);
    auto args = std::vector<Tensor>{
        Tensor::from_vector<int64_t>({7, -7, 7, -7}),
        Tensor::from_vector<int64_t>({2, 2, -2, -2})};
    ExpectTensorEquals<int64_t>(Eval1({a, b}, int_div(a, b), args),
                                {3, -4, -4, 3});
    ExpectTensorEquals<int64_t>(Eval1({a, b}, mod(a, b), args),
                                {1, 1, -1, -1});
    ExpectTensorEquals<double>(Eval1({a, b}, a / b, args),
                               {3.5, -3.5, -3.5, 3.5});
}

TEST(Ops, UnaryMath) {
    auto x = input("x", DType::Float64, 1);
    auto arg = Vec({0.0, 1.0, 4.0});
    ExpectTensorEquals<double>(Eval1({x}, sqrt(x), {arg}), {0, 1, 2});
    ExpectTensorEquals<double>(Eval1({x}, sqr(x), {arg}), {0, 1, 16});
    ExpectTensorEquals<double>(Eval1({x}, -x, {arg}), {0, -1, -4});
    ExpectTensorEquals<double>(Eval1({x}, exp(x), {arg}),
                               {1, std::exp(1.0), std::exp(4.0)}, 1e-9);
    ExpectTensorEquals<double>(Eval1({x}, sigmoid(x), {Vec({0.0})}), {0.5});
}

TEST(Ops, ComparisonsAndSwitch) {
    auto x = input("x", DType::Float64, 1);
    auto positive = x > 0.0;
    auto r = Eval1({x}, switch_(positive, x, -x), {Vec({-2, 3, -1})});
    ExpectTensorEquals<double>(r, {2, 3, 1});

    auto b = Eval1({x}, logical_not(positive), {Vec({-1, 1})});
    EXPECT_EQ(b.dtype(), DType::Bool);
    EXPECT_EQ(b.to_vector<bool>(), (std::vector<bool>{true, false}));
}

TEST(Ops, CastAndFill) {
    auto x = input("x", DType::Float64, 1);
    auto c = Eval1({x}, cast(x, DType::Int32), {Vec({1.9, -1.9})});
    EXPECT_EQ(c.dtype(), DType::Int32);
    ExpectTensorEquals<int32_t>(c, {1, -1});

    auto z = Eval1({x}, ones_like(x), {Vec({5, 6, 7})});
    ExpectTensorEquals<double>(z, {1, 1, 1});
}

// ============================================================================
// Reductions and dot
// ============================================================================

TEST(Ops, Reductions) {
    auto m = input("m", DType::Float64, 2);
    auto arg = Mat({1, 2, 3, 4, 5, 6}, 2, 3);
    EXPECT_DOUBLE_EQ(Eval1({m}, sum(m), {arg}).item<double>(), 21.0);
    ExpectTensorEquals<double>(Eval1({m}, sum(m, {0}), {arg}), {5, 7, 9});
    ExpectTensorEquals<double>(Eval1({m}, max(m, {1}), {arg}), {3, 6});
    ExpectTensorEquals<double>(Eval1({m}, mean(m, {1}), {arg}), {2, 5});
    ExpectTensorEquals<double>(Eval1({m}, prod(m, {1}), {arg}), {6, 120});

    auto kept = Eval1({m}, sum(m, {1}, true), {arg});
    EXPECT_EQ(kept.shape(), (Shape{2, 1}));
}

TEST(Ops, MaxOfEmptyThrows) {
    auto v = input("v", DType::Float64, 1);
    EXPECT_THROW(Eval1({v}, max(v), {Tensor::zeros({0})}), ValueError);
}

TEST(Ops, DotShapes) {
    auto a = input("a", DType::Float64, 2);
    auto v = input("v", DType::Float64, 1);
    auto r = Eval1({a, v}, dot(a, v), {Mat({1, 2, 3, 4}, 2, 2), Vec({1, 1})});
    ExpectTensorEquals<double>(r, {3, 7});

    auto mm = Eval1({a}, dot(a, a), {Mat({1, 2, 3, 4}, 2, 2)});
    ExpectTensorEquals<double>(mm, {7, 10, 15, 22});

    EXPECT_THROW(Eval1({a, v}, dot(a, v),
                       {Mat({1, 2, 3, 4}, 2, 2), Vec({1, 1, 1})}),
                 ShapeError);
}

// ============================================================================
// Structural
// ============================================================================

TEST(Ops, SubtensorAndSlice) {
    auto m = input("m", DType::Float64, 2);
    auto arg = Mat({0, 1, 2, 3, 4, 5}, 2, 3);
    ExpectTensorEquals<double>(Eval1({m}, subtensor(m, 0, -1), {arg}),
                               {3, 4, 5});
    ExpectTensorEquals<double>(Eval1({m}, subtensor(m, 1, 0), {arg}), {0, 3});
    ExpectTensorEquals<double>(
        Eval1({m}, slice(m, 1, std::nullopt, std::nullopt, -1), {arg}),
        {2, 1, 0, 5, 4, 3});
    EXPECT_THROW(Eval1({m}, subtensor(m, 0, 5), {arg}), IndexError);
}

TEST(Ops, SetAndIncSubtensorLeaveInputUntouched) {
    auto v = input("v", DType::Float64, 1);
    auto arg = Vec({1, 2, 3, 4});
    auto set = Eval1({v}, set_subtensor(slice(v, 0, 1, 3), constant(0.0)),
                     {arg});
    ExpectTensorEquals<double>(set, {1, 0, 0, 4});
    auto inc = Eval1({v}, inc_subtensor(subtensor(v, 0, -1), constant(10.0)),
                     {arg});
    ExpectTensorEquals<double>(inc, {1, 2, 3, 14});
    ExpectTensorEquals<double>(arg, {1, 2, 3, 4});
}

TEST(Ops, ReshapeDimshuffleTranspose) {
    auto v = input("v", DType::Int64, 1);
    auto r = Eval1({v}, reshape(v, {2, -1}), {Tensor::arange(6)});
    EXPECT_EQ(r.shape(), (Shape{2, 3}));

    auto m = input("m", DType::Int64, 2);
    auto t = Eval1({m}, transpose(m), {Tensor::arange(6).reshape({2, 3})});
    EXPECT_EQ(t.shape(), (Shape{3, 2}));
    ExpectTensorEquals<int64_t>(t, {0, 3, 1, 4, 2, 5});

    auto row = Eval1({v}, dimshuffle(v, {-1, 0}), {Tensor::arange(3)});
    EXPECT_EQ(row.shape(), (Shape{1, 3}));

    EXPECT_THROW(Eval1({v}, reshape(v, {4, -1}), {Tensor::arange(6)}),
                 ShapeError);
}

TEST(Ops, AllocAndShapeI) {
    auto v = input("v", DType::Float64, 1);
    auto filled = Eval1({v}, alloc(v, std::vector<Variable>{shape_i(v, 0),
                                                            shape_i(v, 0)}),
                        {Vec({1, 2})});
    EXPECT_EQ(filled.shape(), (Shape{2, 2}));
    ExpectTensorEquals<double>(filled, {1, 2, 1, 2});

    auto n = Eval1({v}, shape_i(v, 0), {Vec({1, 2, 3})});
    EXPECT_EQ(n.dtype(), DType::Int64);
    EXPECT_EQ(n.item<int64_t>(), 3);
}

TEST(Ops, DeepCopyReturnsFreshBuffer) {
    auto v = input("v", DType::Float64, 1);
    auto arg = Vec({1, 2});
    auto r = Eval1({v}, deep_copy(v), {arg});
    EXPECT_FALSE(r.shares_memory(arg));
    EXPECT_TRUE(r.array_equal(arg));
}
