#include "arbor_test_utils.hpp"

using namespace arbor;
using namespace arbor::testing;

// ============================================================================
// Construction and dtypes
// ============================================================================

TEST(Tensor, FactoriesFillShapeAndDtype) {
    auto z = Tensor::zeros({2, 3});
    EXPECT_EQ(z.shape(), (Shape{2, 3}));
    EXPECT_EQ(z.dtype(), DType::Float64);
    ExpectTensorEquals<double>(z, {0, 0, 0, 0, 0, 0});

    auto o = Tensor::ones({4}, DType::Int32);
    EXPECT_EQ(o.dtype(), DType::Int32);
    ExpectTensorEquals<int32_t>(o, {1, 1, 1, 1});

    auto r = Tensor::arange(5);
    EXPECT_EQ(r.dtype(), DType::Int64);
    ExpectTensorEquals<int64_t>(r, {0, 1, 2, 3, 4});

    auto s = Tensor::scalar<double>(2.5);
    EXPECT_EQ(s.ndim(), 0u);
    EXPECT_DOUBLE_EQ(s.item<double>(), 2.5);
}

TEST(Tensor, FromVectorRejectsWrongSize) {
    EXPECT_THROW(Tensor::from_vector<double>({1, 2, 3}, Shape{2, 2}),
                 ShapeError);
}

TEST(Tensor, ItemRequiresSingleElement) {
    EXPECT_THROW(Vec({1, 2}).item<double>(), ValueError);
}

TEST(Tensor, AstypeConvertsValues) {
    auto t = Vec({1.7, -2.2, 0.0});
    auto i = t.astype(DType::Int64);
    EXPECT_EQ(i.dtype(), DType::Int64);
    ExpectTensorEquals<int64_t>(i, {1, -2, 0});

    auto b = t.astype(DType::Bool);
    EXPECT_EQ(b.to_vector<bool>(), (std::vector<bool>{true, true, false}));
}

TEST(Tensor, PromotionFollowsNumpyForSupportedTypes) {
    EXPECT_EQ(promote_types(DType::Bool, DType::Int32), DType::Int32);
    EXPECT_EQ(promote_types(DType::Int32, DType::Int64), DType::Int64);
    EXPECT_EQ(promote_types(DType::Int64, DType::Float32), DType::Float64);
    EXPECT_EQ(promote_types(DType::Int32, DType::Float32), DType::Float64);
    EXPECT_EQ(promote_types(DType::Float32, DType::Float64), DType::Float64);
    EXPECT_EQ(promote_types(DType::Bool, DType::Bool), DType::Bool);
}

TEST(Tensor, SafeCasts) {
    EXPECT_TRUE(can_cast_safely(DType::Int32, DType::Int64));
    EXPECT_TRUE(can_cast_safely(DType::Int64, DType::Float64));
    EXPECT_TRUE(can_cast_safely(DType::Bool, DType::Float32));
    EXPECT_FALSE(can_cast_safely(DType::Float64, DType::Float32));
    EXPECT_FALSE(can_cast_safely(DType::Float64, DType::Int64));
}

// ============================================================================
// Views and memory
// ============================================================================

TEST(Tensor, CopiesShareStorageUntilCopied) {
    auto a = Vec({1, 2, 3});
    Tensor alias = a;
    Tensor copy = a.copy();
    EXPECT_TRUE(alias.shares_memory(a));
    EXPECT_FALSE(copy.shares_memory(a));

    alias.set_item<double>({0}, 10.0);
    EXPECT_DOUBLE_EQ(a.item<double>({0}), 10.0);
    EXPECT_DOUBLE_EQ(copy.item<double>({0}), 1.0);
}

TEST(Tensor, IndexAndSliceAreViews) {
    auto m = Mat({0, 1, 2, 3, 4, 5}, 2, 3);
    auto row = m.index(0, 1);
    EXPECT_EQ(row.shape(), (Shape{3}));
    ExpectTensorEquals<double>(row, {3, 4, 5});
    EXPECT_TRUE(row.shares_memory(m));

    auto last = m.index(0, -1);
    ExpectTensorEquals<double>(last, {3, 4, 5});

    auto col = m.slice(1, 1, std::nullopt);
    EXPECT_EQ(col.shape(), (Shape{2, 2}));
    ExpectTensorEquals<double>(col, {1, 2, 4, 5});
    EXPECT_FALSE(col.is_contiguous());

    auto reversed = Vec({1, 2, 3, 4}).slice(0, std::nullopt, std::nullopt, -1);
    ExpectTensorEquals<double>(reversed, {4, 3, 2, 1});

    EXPECT_THROW(m.index(0, 2), IndexError);
}

TEST(Tensor, TransposeAndContiguous) {
    auto m = Mat({0, 1, 2, 3, 4, 5}, 2, 3);
    auto t = m.transpose({1, 0});
    EXPECT_EQ(t.shape(), (Shape{3, 2}));
    EXPECT_FALSE(t.is_contiguous());
    ExpectTensorEquals<double>(t, {0, 3, 1, 4, 2, 5});

    auto c = t.contiguous();
    EXPECT_TRUE(c.is_contiguous());
    EXPECT_FALSE(c.shares_memory(m));
    EXPECT_TRUE(c.array_equal(t));
}

TEST(Tensor, BroadcastToUsesZeroStrides) {
    auto v = Vec({1, 2, 3});
    auto b = v.broadcast_to({2, 3});
    EXPECT_EQ(b.strides()[0], 0);
    ExpectTensorEquals<double>(b, {1, 2, 3, 1, 2, 3});
    EXPECT_THROW(v.broadcast_to({2, 4}), ShapeError);
}

TEST(Tensor, BroadcastShape) {
    EXPECT_EQ(ShapeUtils::broadcast_shape({3, 1}, {4}), (Shape{3, 4}));
    EXPECT_EQ(ShapeUtils::broadcast_shape({}, {2, 2}), (Shape{2, 2}));
    EXPECT_THROW(ShapeUtils::broadcast_shape({3}, {4}), ShapeError);
}

TEST(Tensor, ReshapeChecksSize) {
    auto t = Tensor::arange(6).reshape({2, 3});
    EXPECT_EQ(t.shape(), (Shape{2, 3}));
    EXPECT_THROW(t.reshape({4}), ShapeError);
}

TEST(Tensor, CopyFromBroadcastsSource) {
    auto dst = Tensor::zeros({2, 2});
    dst.copy_from(Vec({7, 8}));
    ExpectTensorEquals<double>(dst, {7, 8, 7, 8});
}

TEST(Tensor, AllcloseTreatsNanOnlyWhenAsked) {
    auto a = Vec({1.0, std::nan("")});
    auto b = Vec({1.0 + 1e-9, std::nan("")});
    EXPECT_FALSE(a.allclose(b));
    EXPECT_TRUE(a.allclose(b, 1e-5, 1e-8, true));
}
