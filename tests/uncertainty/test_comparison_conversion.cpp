#include <gtest/gtest.h>
#include "aunc/uncertainty.hpp"
#include "aunc/diagnostics.hpp"

#include <complex>
#include <vector>

using namespace aunc;
using aunc::diagnostics::ScopedWarningCapture;
using aunc::diagnostics::WarningKind;

// ─── Comparisons ─────────────────────────────────────────────────────────────

TEST(Uncertainty_Compare, EqualityIgnoresError) {
    const Uncertainty a(2.0, 0.1);
    const Uncertainty b(2.0, 5.0);
    EXPECT_TRUE(static_cast<bool>(a == b));
    EXPECT_FALSE(static_cast<bool>(a != b));
}

TEST(Uncertainty_Compare, OrderingOnNominal) {
    const Uncertainty a(1.0, 10.0);
    const Uncertainty b(2.0, 0.0);
    EXPECT_TRUE(static_cast<bool>(a < b));
    EXPECT_TRUE(static_cast<bool>(a <= b));
    EXPECT_FALSE(static_cast<bool>(a > b));
    EXPECT_FALSE(static_cast<bool>(a >= b));
    EXPECT_TRUE(static_cast<bool>(a < 1.5));
    EXPECT_TRUE(static_cast<bool>(1.5 > a));
    EXPECT_TRUE(static_cast<bool>(a == 1.0));
}

TEST(Uncertainty_Compare, ArraysGiveElementwiseMask) {
    const Uncertainty a(NDArray{1.0, 2.0, 3.0}, NDArray{0.1, 0.1, 0.1});
    const Mask m = a > 1.5;
    EXPECT_EQ(m.shape(), (Shape{3}));
    EXPECT_FALSE(m[0]);
    EXPECT_TRUE(m[1]);
    EXPECT_TRUE(m[2]);
    EXPECT_THROW(static_cast<void>(static_cast<bool>(m)), ConversionUnsupported);
}

// ─── Scalar conversions ──────────────────────────────────────────────────────

TEST(Uncertainty_Convert, ScalarConversionsReadNominal) {
    ScopedWarningCapture capture;
    const Uncertainty u(2.75, 0.5);
    EXPECT_DOUBLE_EQ(u.to_double(), 2.75);
    EXPECT_DOUBLE_EQ(static_cast<double>(u), 2.75);
    EXPECT_EQ(u.to_int(), 2);
    EXPECT_EQ(Uncertainty(-2.75, 0.5).to_int(), -2);
    EXPECT_EQ(u.to_complex(), std::complex<double>(2.75, 0.0));
    EXPECT_TRUE(static_cast<bool>(u));
    EXPECT_FALSE(static_cast<bool>(Uncertainty(0.0, 0.5)));
    EXPECT_EQ(capture.records().size(), 0U);
}

TEST(Uncertainty_Convert, SingleElementArrayConverts) {
    const Uncertainty u(NDArray{4.5}, NDArray{0.5});
    EXPECT_DOUBLE_EQ(u.to_double(), 4.5);
}

TEST(Uncertainty_Convert, MultiElement_Throws) {
    const Uncertainty u(NDArray{1.0, 2.0}, NDArray{0.1, 0.1});
    EXPECT_THROW(static_cast<void>(u.to_double()), ConversionUnsupported);
    EXPECT_THROW(static_cast<void>(u.to_int()), ConversionUnsupported);
    EXPECT_THROW(static_cast<void>(static_cast<bool>(u)), ConversionUnsupported);
}

// ─── Downcast ────────────────────────────────────────────────────────────────

TEST(Uncertainty_Downcast, WarnsAndReturnsNominalUnchanged) {
    ScopedWarningCapture capture;
    const Uncertainty u(NDArray{1.0, 2.0}, NDArray{0.1, 0.2});
    const NDArray plain = u.to_array();
    EXPECT_TRUE(array_equal(plain, NDArray{1.0, 2.0}));
    EXPECT_TRUE(plain.shares_storage_with(u.value()));
    EXPECT_EQ(capture.count(WarningKind::downcast), 1U);
}

TEST(Uncertainty_Downcast, SilentPolicy) {
    ScopedWarningCapture capture;
    const Uncertainty u(1.0, 0.1);
    static_cast<void>(u.to_array(DowncastPolicy::silent));
    EXPECT_EQ(capture.count(WarningKind::downcast), 0U);
}

TEST(Uncertainty_Downcast, RaisePolicy_Throws) {
    const Uncertainty u(1.0, 0.1);
    EXPECT_THROW(static_cast<void>(u.to_array(DowncastPolicy::raise)), DowncastError);
}

// ─── Component access ────────────────────────────────────────────────────────

TEST(Uncertainty_Components, NominalValuesAndStdDevs) {
    const Uncertainty u(NDArray{1.0, 2.0}, NDArray{0.1, 0.2});
    const NDArray plain{3.0, 4.0};
    EXPECT_TRUE(array_equal(nominal_values(u), u.value()));
    EXPECT_TRUE(array_equal(std_devs(u), u.error()));
    EXPECT_TRUE(array_equal(nominal_values(plain), plain));
    EXPECT_TRUE(array_equal(std_devs(plain), NDArray{0.0, 0.0}));
}
