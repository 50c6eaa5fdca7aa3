#include <gtest/gtest.h>
#include "aunc/dispatch.hpp"
#include "aunc/diagnostics.hpp"
#include "aunc/constants.hpp"

#include <cmath>
#include <string>
#include <vector>

using namespace aunc;
using namespace aunc::constants;
using aunc::diagnostics::ScopedWarningCapture;
using aunc::diagnostics::WarningKind;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static const OperationRegistry& default_registry() {
    static const OperationRegistry registry = make_default_registry();
    return registry;
}

static const Dispatcher& dispatcher() {
    static const Dispatcher d(default_registry());
    return d;
}

static Uncertainty vec() {
    return Uncertainty(NDArray{1.0, 2.0, 3.0, 4.0}, NDArray{0.3, 0.4, 0.0, 0.0});
}

// ─── Routing ─────────────────────────────────────────────────────────────────

TEST(Dispatcher_Routing, UfuncMatchesOperator) {
    const Uncertainty a(1.5, 0.3);
    const Uncertainty b(2.5, 0.4);
    const Uncertainty viaDispatch = dispatcher().ufunc("add", {a, b});
    const Uncertainty viaOperator = a + b;
    EXPECT_DOUBLE_EQ(viaDispatch.value().item(), viaOperator.value().item());
    EXPECT_DOUBLE_EQ(viaDispatch.error().item(), viaOperator.error().item());
}

TEST(Dispatcher_Routing, PlainOperandOnTheLeft) {
    const Uncertainty r = dispatcher().ufunc("divide", {NDArray(8.0), Uncertainty(2.0, 0.1)});
    EXPECT_DOUBLE_EQ(r.value().item(), 4.0);
    EXPECT_NEAR(r.error().item(), 0.2, FLOAT_EPSILON);

    const Uncertainty d = dispatcher().ufunc("subtract", {NDArray(5.0), Uncertainty(2.0, 0.1)});
    EXPECT_DOUBLE_EQ(d.value().item(), 3.0);
    EXPECT_DOUBLE_EQ(d.error().item(), 0.1);
}

TEST(Dispatcher_Routing, ElementaryUfuncs) {
    const Uncertainty r = dispatcher().ufunc("sqrt", {Uncertainty(4.0, 0.4)});
    EXPECT_DOUBLE_EQ(r.value().item(), 2.0);
    EXPECT_NEAR(r.error().item(), 0.1, FLOAT_EPSILON);
}

TEST(Dispatcher_Routing, PowerUfuncIsFirstOrder) {
    // The operator form has zero error; the ufunc propagates.
    const Uncertainty r = dispatcher().ufunc("power", {Uncertainty(2.0, 0.1), NDArray(3.0)});
    EXPECT_DOUBLE_EQ(r.value().item(), 8.0);
    EXPECT_NEAR(r.error().item(), 1.2, 1e-12);
}

TEST(Dispatcher_Routing, ResultIsNewValue) {
    const Uncertainty u = vec();
    const Uncertainty r = dispatcher().ufunc("positive", {u});
    EXPECT_FALSE(r.shares_storage_with(u));
}

// ─── Closed-form functions ───────────────────────────────────────────────────

TEST(Dispatcher_ClosedForm, SumAndMean) {
    const Uncertainty s = dispatcher().function("sum", {vec()});
    EXPECT_DOUBLE_EQ(s.value().item(), 10.0);
    EXPECT_NEAR(s.error().item(), 0.5, FLOAT_EPSILON);

    const Uncertainty m = dispatcher().function("mean", {vec()});
    EXPECT_NEAR(m.error().item(), 0.125, FLOAT_EPSILON);
}

TEST(Dispatcher_ClosedForm, SumAlongAxisKeyword) {
    Uncertainty u = vec();
    u.set_shape({2, 2});
    const Uncertainty s = dispatcher().function("sum", {u}, Params{{"axis", Index{1}}});
    EXPECT_EQ(s.shape(), (Shape{2}));
    EXPECT_EQ(s.value().to_vector(), (std::vector<double>{3.0, 7.0}));
    EXPECT_NEAR(s.error().at(0), 0.5, FLOAT_EPSILON);
}

TEST(Dispatcher_ClosedForm, ClipWithKeywordBounds) {
    const Uncertainty c = dispatcher().function("clip", {vec()},
                                              Params{{"a_min", 2.0}, {"a_max", 3.0}});
    EXPECT_EQ(c.value().to_vector(), (std::vector<double>{2.0, 2.0, 3.0, 3.0}));
    EXPECT_TRUE(array_equal(c.error(), vec().error()));
}

TEST(Dispatcher_ClosedForm, ClipUncertainBoundWarns) {
    ScopedWarningCapture capture;
    const Uncertainty c = dispatcher().function("clip", {vec(), Uncertainty(2.5, 0.1), NDArray(3.5)});
    EXPECT_EQ(c.value().to_vector(), (std::vector<double>{2.5, 2.5, 3.0, 3.5}));
    EXPECT_EQ(capture.count(WarningKind::downcast), 1U);
}

TEST(Dispatcher_ClosedForm, ClipUncertainBoundUnderRaisePolicy_Throws) {
    DispatchConfig config;
    config.downcast = DowncastPolicy::raise;
    const Dispatcher strict(default_registry(), config);
    EXPECT_THROW(static_cast<void>(strict.function("clip", {vec(), Uncertainty(2.5, 0.1)})),
                 DowncastError);
}

TEST(Dispatcher_ClosedForm, RoundDecimals) {
    const Uncertainty r = dispatcher().function("round", {Uncertainty(2.345, 0.1)},
                                              Params{{"decimals", Index{2}}});
    EXPECT_NEAR(r.value().item(), 2.34, 1e-12);
    EXPECT_DOUBLE_EQ(r.error().item(), 0.1);
}

// ─── Pass-through functions ──────────────────────────────────────────────────

TEST(Dispatcher_PassThrough, ReshapeAppliesToBothBuffers) {
    const Uncertainty r = dispatcher().function("reshape", {vec()}, Params{{"shape", Shape{2, 2}}});
    EXPECT_EQ(r.shape(), (Shape{2, 2}));
    EXPECT_EQ(r.error().shape(), (Shape{2, 2}));
    EXPECT_DOUBLE_EQ(r.error().at(1), 0.4);
}

TEST(Dispatcher_PassThrough, ConcatenateMixesPlainAndUncertain) {
    const Uncertainty r = dispatcher().function(
        "concatenate", {Uncertainty(NDArray{1.0, 2.0}, NDArray{0.1, 0.2}), NDArray{3.0}});
    EXPECT_EQ(r.value().to_vector(), (std::vector<double>{1.0, 2.0, 3.0}));
    EXPECT_EQ(r.error().to_vector(), (std::vector<double>{0.1, 0.2, 0.0}));
}

TEST(Dispatcher_PassThrough, TransposeAndFlip) {
    Uncertainty u = vec();
    u.set_shape({2, 2});
    const Uncertainty t = dispatcher().function("transpose", {u});
    EXPECT_EQ(t.error().to_vector(), (std::vector<double>{0.3, 0.0, 0.4, 0.0}));

    const Uncertainty f = dispatcher().function("flip", {vec()});
    EXPECT_EQ(f.error().to_vector(), (std::vector<double>{0.0, 0.0, 0.4, 0.3}));
}

TEST(Dispatcher_PassThrough, MissingRequiredKeyword_Throws) {
    EXPECT_THROW(static_cast<void>(dispatcher().function("reshape", {vec()})), TypeMismatch);
}

// ─── Not implemented and rejected calls ──────────────────────────────────────

TEST(Dispatcher_Rejected, NoUncertainArgument_NotImplemented) {
    const Call call{CallKind::ufunc, "add", UfuncMethod::call, {NDArray(1.0), NDArray(2.0)}, {}};
    EXPECT_FALSE(dispatcher().dispatch(call).has_value());
}

TEST(Dispatcher_Rejected, UnknownOperation_NotImplemented) {
    const Call call{CallKind::ufunc, "arctan2", UfuncMethod::call,
                    {Uncertainty(1.0, 0.1), NDArray(1.0)}, {}};
    EXPECT_FALSE(dispatcher().dispatch(call).has_value());
    EXPECT_THROW(static_cast<void>(dispatcher().invoke(call)), UnsupportedOperation);
}

TEST(Dispatcher_Rejected, NameUnderWrongKind_NotImplemented) {
    const Call call{CallKind::function, "add", UfuncMethod::call,
                    {Uncertainty(1.0, 0.1), NDArray(1.0)}, {}};
    EXPECT_FALSE(dispatcher().dispatch(call).has_value());
}

TEST(Dispatcher_Rejected, BroadcastModes_Throw) {
    for (UfuncMethod method : {UfuncMethod::reduce, UfuncMethod::accumulate,
                               UfuncMethod::reduceat, UfuncMethod::outer, UfuncMethod::at}) {
        EXPECT_THROW(static_cast<void>(dispatcher().ufunc("add", {vec(), vec()}, method)),
                     UnsupportedBroadcastMode);
    }
}

TEST(Dispatcher_Rejected, WrongArity_Throws) {
    EXPECT_THROW(static_cast<void>(dispatcher().ufunc("add", {vec()})), TypeMismatch);
    EXPECT_THROW(static_cast<void>(dispatcher().ufunc("sqrt", {vec(), vec()})), TypeMismatch);
}

TEST(Dispatcher_Rejected, UnknownKeyword_Throws) {
    EXPECT_THROW(static_cast<void>(dispatcher().function("sum", {vec()}, Params{{"out", Index{0}}})),
                 TypeMismatch);
}

TEST(Dispatcher_Rejected, RuleErrorsPropagate) {
    const Uncertainty a(NDArray{1.0, 2.0}, NDArray{0.1, 0.1});
    const Uncertainty b(NDArray{1.0, 2.0, 3.0}, NDArray{0.1, 0.1, 0.1});
    EXPECT_THROW(static_cast<void>(dispatcher().ufunc("add", {a, b})), ShapeMismatch);
}

// ─── Custom registry and tracing ─────────────────────────────────────────────

TEST(Dispatcher_Custom, CustomRuleIsRouted) {
    OperationRegistry custom;
    custom.register_pass_through(CallKind::function, "double_up", {1, 1}, {},
        [](std::span<const NDArray> a, const RuleContext&) { return a[0] * 2.0; });
    const Dispatcher d(custom);
    const Uncertainty r = d.function("double_up", {Uncertainty(1.0, 0.5)});
    EXPECT_DOUBLE_EQ(r.value().item(), 2.0);
    EXPECT_DOUBLE_EQ(r.error().item(), 1.0);
}

TEST(Dispatcher_Custom, VerboseTracesToStderr) {
    DispatchConfig config;
    config.verbose = true;
    const Dispatcher loud(default_registry(), config);
    testing::internal::CaptureStderr();
    static_cast<void>(loud.ufunc("negative", {Uncertainty(1.0, 0.1)}));
    const std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("negative"), std::string::npos);
    EXPECT_NE(err.find("closed-form"), std::string::npos);
}
