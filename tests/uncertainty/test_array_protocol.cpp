#include <gtest/gtest.h>
#include "aunc/uncertainty.hpp"

#include <vector>

using namespace aunc;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static Uncertainty sample() {
    return Uncertainty(NDArray{1.0, 2.0, 3.0, 4.0, 5.0, 6.0}.reshape({2, 3}),
                       NDArray{0.1, 0.2, 0.3, 0.4, 0.5, 0.6}.reshape({2, 3}));
}

// ─── Indexing ────────────────────────────────────────────────────────────────

TEST(Uncertainty_Index, GetIndexesBothBuffers) {
    const Uncertainty u = sample();
    const Uncertainty row = u[1];
    EXPECT_EQ(row.shape(), (Shape{3}));
    EXPECT_EQ(row.value().to_vector(), (std::vector<double>{4.0, 5.0, 6.0}));
    EXPECT_EQ(row.error().to_vector(), (std::vector<double>{0.4, 0.5, 0.6}));

    const Uncertainty col = u.get(Key{Slice{}, Index{2}});
    EXPECT_EQ(col.value().to_vector(), (std::vector<double>{3.0, 6.0}));
    EXPECT_EQ(col.error().to_vector(), (std::vector<double>{0.3, 0.6}));
}

TEST(Uncertainty_Index, ScalarReceiver_Throws) {
    EXPECT_THROW(static_cast<void>(Uncertainty(1.0, 0.1)[0]), IndexingUnsupported);
}

TEST(Uncertainty_Index, SetWritesNominalAndError) {
    Uncertainty u = sample();
    const Uncertainty alias = u;
    u.set(Key{Index{0}, Index{1}}, Uncertainty(9.0, 0.9));
    EXPECT_DOUBLE_EQ(alias.value().at(1), 9.0);
    EXPECT_DOUBLE_EQ(alias.error().at(1), 0.9);
}

TEST(Uncertainty_Index, SetBroadcastsAcrossSelection) {
    Uncertainty u = sample();
    u.set(Key{Index{1}}, Uncertainty(0.0, 0.0));
    EXPECT_EQ(u.value().to_vector(), (std::vector<double>{1.0, 2.0, 3.0, 0.0, 0.0, 0.0}));
    EXPECT_EQ(u.error().at(5), 0.0);
}

TEST(Uncertainty_Index, SetPlainValue_Throws) {
    Uncertainty u = sample();
    EXPECT_THROW(u.set(Key{Index{0}}, NDArray{1.0, 2.0, 3.0}), TypeMismatch);
    EXPECT_DOUBLE_EQ(u.value().at(0), 1.0);
}

TEST(Uncertainty_Index, SetWrongShape_LeavesValueUntouched) {
    Uncertainty u = sample();
    const Uncertainty wide(NDArray{1.0, 2.0}, NDArray{0.0, 0.0});
    EXPECT_THROW(u.set(Key{Index{0}}, wide), ShapeMismatch);
    EXPECT_EQ(u.value().to_vector(), (std::vector<double>{1.0, 2.0, 3.0, 4.0, 5.0, 6.0}));
}

// ─── Iteration ───────────────────────────────────────────────────────────────

TEST(Uncertainty_Iterate, LeadingAxis) {
    const Uncertainty u = sample();
    std::vector<double> firsts;
    for (const Uncertainty row : u) {
        EXPECT_EQ(row.shape(), (Shape{3}));
        firsts.push_back(row.value().at(0));
    }
    EXPECT_EQ(firsts, (std::vector<double>{1.0, 4.0}));
}

TEST(Uncertainty_Iterate, ScalarReceiver_Throws) {
    const Uncertainty u(1.0, 0.1);
    EXPECT_THROW(static_cast<void>(u.begin()), IndexingUnsupported);
}

TEST(Uncertainty_Iterate, FlatYieldsScalarsRowMajor) {
    const std::vector<Uncertainty> items = sample().flat();
    ASSERT_EQ(items.size(), 6U);
    EXPECT_TRUE(items[4].is_scalar());
    EXPECT_DOUBLE_EQ(items[4].value().item(), 5.0);
    EXPECT_DOUBLE_EQ(items[4].error().item(), 0.5);
}

// ─── Clip / fill / put ───────────────────────────────────────────────────────

TEST(Uncertainty_Protocol, ClipCarriesError) {
    const Uncertainty c = sample().clip(2.0, 5.0);
    EXPECT_EQ(c.value().to_vector(), (std::vector<double>{2.0, 2.0, 3.0, 4.0, 5.0, 5.0}));
    EXPECT_TRUE(array_equal(c.error(), sample().error()));

    const Uncertainty upper = sample().clip(std::nullopt, 3.0);
    EXPECT_DOUBLE_EQ(upper.value().at(5), 3.0);
}

TEST(Uncertainty_Protocol, FillNumberChangesNominalOnly) {
    Uncertainty u = sample();
    u.fill(7.0);
    EXPECT_EQ(u.value().to_vector(), (std::vector<double>(6, 7.0)));
    EXPECT_DOUBLE_EQ(u.error().at(2), 0.3);
}

TEST(Uncertainty_Protocol, FillUncertaintySetsBoth) {
    Uncertainty u = sample();
    u.fill(Uncertainty(7.0, 0.7));
    EXPECT_EQ(u.value().to_vector(), (std::vector<double>(6, 7.0)));
    EXPECT_EQ(u.error().to_vector(), (std::vector<double>(6, 0.7)));
}

TEST(Uncertainty_Protocol, FillRejectsPlainArrayAndScalarReceiver) {
    Uncertainty u = sample();
    EXPECT_THROW(u.fill(NDArray{1.0, 2.0}), TypeMismatch);

    Uncertainty s(1.0, 0.1);
    EXPECT_THROW(s.fill(2.0), AttributeUnavailable);
}

TEST(Uncertainty_Protocol, PutCyclesValues) {
    Uncertainty u(NDArray::zeros({4}), NDArray::zeros({4}));
    const std::vector<Index> where{1, 3};
    u.put(where, Uncertainty(NDArray{5.0, 6.0}, NDArray{0.5, 0.6}));
    EXPECT_EQ(u.value().to_vector(), (std::vector<double>{0.0, 5.0, 0.0, 6.0}));
    EXPECT_EQ(u.error().to_vector(), (std::vector<double>{0.0, 0.5, 0.0, 0.6}));
}

TEST(Uncertainty_Protocol, PutRejectsPlainArrayAndScalarReceiver) {
    Uncertainty u(NDArray::zeros({4}), NDArray::zeros({4}));
    const std::vector<Index> where{0};
    EXPECT_THROW(u.put(where, NDArray(1.0)), TypeMismatch);

    Uncertainty s(1.0, 0.1);
    EXPECT_THROW(s.put(where, Uncertainty(2.0, 0.2)), AttributeUnavailable);
}

// ─── Views of the value ──────────────────────────────────────────────────────

TEST(Uncertainty_Protocol, RealAndImag) {
    const Uncertainty u = sample();
    EXPECT_TRUE(array_equal(u.real().value(), u.value()));
    EXPECT_FALSE(u.real().shares_storage_with(u));
    EXPECT_EQ(u.imag().value().to_vector(), (std::vector<double>(6, 0.0)));
    EXPECT_EQ(u.imag().error().to_vector(), (std::vector<double>(6, 0.0)));
}

TEST(Uncertainty_Protocol, TransposeSwapsAxes) {
    const Uncertainty t = sample().T();
    EXPECT_EQ(t.shape(), (Shape{3, 2}));
    EXPECT_EQ(t.value().to_vector(), (std::vector<double>{1.0, 4.0, 2.0, 5.0, 3.0, 6.0}));
    EXPECT_EQ(t.error().to_vector(), (std::vector<double>{0.1, 0.4, 0.2, 0.5, 0.3, 0.6}));
}

TEST(Uncertainty_Protocol, SearchSortedUsesNominal) {
    const Uncertainty u(NDArray{1.0, 2.0, 2.0, 4.0}, NDArray{9.0, 9.0, 9.0, 9.0});
    EXPECT_EQ(u.searchsorted(2.0), 1);
    EXPECT_EQ(u.searchsorted(2.0, Side::right), 3);
    EXPECT_EQ(u.searchsorted(10.0), 4);
}

TEST(Uncertainty_Protocol, ToListNests) {
    const UncertaintyList list = sample().tolist();
    ASSERT_FALSE(list.is_leaf());
    ASSERT_EQ(list.items().size(), 2U);
    const UncertaintyList& row = list.items()[1];
    ASSERT_EQ(row.items().size(), 3U);
    ASSERT_TRUE(row.items()[0].is_leaf());
    EXPECT_DOUBLE_EQ(row.items()[0].leaf().value().item(), 4.0);
    EXPECT_DOUBLE_EQ(row.items()[0].leaf().error().item(), 0.4);

    EXPECT_TRUE(Uncertainty(1.0, 0.1).tolist().is_leaf());
}

// ─── Forwarded attributes ────────────────────────────────────────────────────

TEST(Uncertainty_Attribute, ForwardsToNominal) {
    const Uncertainty u = sample();
    EXPECT_DOUBLE_EQ(u.attribute("sum").item(), 21.0);
    EXPECT_DOUBLE_EQ(u.attribute("max").item(), 6.0);
    EXPECT_DOUBLE_EQ(u.attribute("argmin").item(), 0.0);
    EXPECT_EQ(u.attribute("ravel").shape(), (Shape{6}));
}

TEST(Uncertainty_Attribute, ArrayProtocolAndUnknownNames_Throw) {
    const Uncertainty u = sample();
    EXPECT_THROW(static_cast<void>(u.attribute("__array_interface__")), AttributeUnavailable);
    EXPECT_THROW(static_cast<void>(u.attribute("no_such_method")), AttributeUnavailable);
}
