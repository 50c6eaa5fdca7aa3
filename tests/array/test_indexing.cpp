#include <gtest/gtest.h>
#include "aunc/ndarray.hpp"

#include <vector>

using namespace aunc;

// ─── Helpers ─────────────────────────────────────────────────────────────────

/// 0..n-1 as a one-dimensional array.
static NDArray arange(Index n) {
    Eigen::ArrayXd data = Eigen::ArrayXd::LinSpaced(n, 0.0, static_cast<double>(n - 1));
    return NDArray(Shape{n}, std::move(data));
}

// ─── Integer keys ────────────────────────────────────────────────────────────

TEST(Indexing_Integer, DropsAxis) {
    const NDArray a = arange(6).reshape({2, 3});
    const NDArray row = a.index({Index{1}});
    EXPECT_EQ(row.shape(), (Shape{3}));
    EXPECT_EQ(row.to_vector(), (std::vector<double>{3.0, 4.0, 5.0}));

    const NDArray cell = a.index({Index{1}, Index{2}});
    EXPECT_TRUE(cell.is_scalar());
    EXPECT_DOUBLE_EQ(cell.item(), 5.0);
}

TEST(Indexing_Integer, NegativeCountsFromEnd) {
    EXPECT_DOUBLE_EQ(arange(5).index({Index{-1}}).item(), 4.0);
}

TEST(Indexing_Integer, OutOfRange_Throws) {
    EXPECT_THROW(static_cast<void>(arange(3).index({Index{3}})), IndexingUnsupported);
    EXPECT_THROW(static_cast<void>(arange(3).index({Index{-4}})), IndexingUnsupported);
}

TEST(Indexing_Integer, TooManyIndices_Throws) {
    EXPECT_THROW(static_cast<void>(arange(3).index({Index{0}, Index{0}})), IndexingUnsupported);
}

TEST(Indexing_Integer, ScalarReceiver_Throws) {
    EXPECT_THROW(static_cast<void>(NDArray(1.0).index({Index{0}})), IndexingUnsupported);
}

// ─── Slice keys ──────────────────────────────────────────────────────────────

TEST(Indexing_Slice, StartStopStep) {
    const NDArray s = arange(10).index({Slice{2, 8, 2}});
    EXPECT_EQ(s.to_vector(), (std::vector<double>{2.0, 4.0, 6.0}));
}

TEST(Indexing_Slice, OpenBoundsAndClamping) {
    EXPECT_EQ(arange(5).index({Slice{std::nullopt, 2}}).to_vector(), (std::vector<double>{0.0, 1.0}));
    EXPECT_EQ(arange(5).index({Slice{3, 100}}).to_vector(), (std::vector<double>{3.0, 4.0}));
    EXPECT_EQ(arange(5).index({Slice{4, 1}}).size(), 0);
}

TEST(Indexing_Slice, NegativeStepReverses) {
    EXPECT_EQ(arange(5).index({Slice{std::nullopt, std::nullopt, -1}}).to_vector(),
              (std::vector<double>{4.0, 3.0, 2.0, 1.0, 0.0}));
    EXPECT_EQ(arange(6).index({Slice{4, 0, -2}}).to_vector(), (std::vector<double>{4.0, 2.0}));
    EXPECT_EQ(arange(5).index({Slice{-2, std::nullopt, -1}}).to_vector(),
              (std::vector<double>{3.0, 2.0, 1.0, 0.0}));
}

TEST(Indexing_Slice, ZeroStep_Throws) {
    EXPECT_THROW(static_cast<void>(arange(5).index({Slice{std::nullopt, std::nullopt, 0}})),
                 IndexingUnsupported);
}

TEST(Indexing_Slice, MixedWithInteger) {
    const NDArray a = arange(6).reshape({2, 3});
    const NDArray col = a.index({Slice{}, Index{1}});
    EXPECT_EQ(col.shape(), (Shape{2}));
    EXPECT_EQ(col.to_vector(), (std::vector<double>{1.0, 4.0}));
}

// ─── Assignment ──────────────────────────────────────────────────────────────

TEST(Indexing_Assign, ScatterBroadcastsValue) {
    NDArray a = NDArray::zeros({2, 3});
    NDArray alias = a;
    a.assign(Key{Slice{}, Index{0}}, NDArray(9.0));
    EXPECT_EQ(alias.to_vector(), (std::vector<double>{9.0, 0.0, 0.0, 9.0, 0.0, 0.0}));
}

TEST(Indexing_Assign, IncompatibleValue_Throws) {
    NDArray a = NDArray::zeros({3});
    EXPECT_THROW(a.assign(Key{Slice{0, 2}}, NDArray{1.0, 2.0, 3.0}), ShapeMismatch);
}

// ─── put ─────────────────────────────────────────────────────────────────────

TEST(Indexing_Put, CyclesValues) {
    NDArray a = NDArray::zeros({5});
    const std::vector<Index> where{0, 2, 4};
    a.put(where, NDArray{1.0, 2.0});
    EXPECT_EQ(a.to_vector(), (std::vector<double>{1.0, 0.0, 2.0, 0.0, 1.0}));
}

TEST(Indexing_Put, BadIndex_LeavesArrayUntouched) {
    NDArray a = NDArray::zeros({3});
    const std::vector<Index> where{0, 7};
    EXPECT_THROW(a.put(where, NDArray(1.0)), IndexingUnsupported);
    EXPECT_EQ(a.to_vector(), (std::vector<double>{0.0, 0.0, 0.0}));
}
