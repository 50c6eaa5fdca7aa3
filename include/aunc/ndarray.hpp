#pragma once

/// @file include/aunc/ndarray.hpp
/// @brief NDArray: the n-dimensional numeric array boundary over Eigen.
///
/// # Module: Array Boundary
///
/// ## Responsibility
/// Give Eigen's flat `ArrayXd` kernels the shape, broadcasting and indexing
/// surface that Uncertainty and the Dispatcher consume:
///   - row-major n-dimensional shape over one flat Eigen buffer
///   - numpy broadcasting for binary elementwise operations
///   - basic indexing (integer and slice keys), scatter and put
///   - structural operations (reshape, transpose, squeeze, concatenate, ...)
///   - whole-array and per-axis reductions
///
/// ## Reference Semantics
/// Copies of an NDArray alias the same storage, like numpy array references.
/// In-place operations (`assign`, `put`, `fill`, `set_shape`, writes through
/// `values()`) are visible through every alias. `copy()` detaches.
///
/// A rank-0 NDArray (empty shape) is *scalar-backed*; everything else is
/// *array-backed*.
///
/// ## Guarantees
/// - Shape/size violations throw ShapeMismatch
/// - Rejected keys throw IndexingUnsupported
/// - Not internally synchronised: concurrent mutation is a data race
///
/// ## NOT Responsible For
/// - Error propagation (see propagation.hpp)
/// - Printing (see format.hpp)

#include "aunc/errors.hpp"
#include "aunc/types.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace aunc {

class Mask;

// ─── Shape Helpers ────────────────────────────────────────────────────────────

/// Number of elements described by `shape` (1 for the scalar shape).
[[nodiscard]] Index element_count(const Shape& shape) noexcept;

/// Result shape of broadcasting `a` against `b` under numpy rules.
/// Throws ShapeMismatch when the shapes are incompatible.
[[nodiscard]] Shape broadcast_shapes(const Shape& a, const Shape& b);

/// Render a shape as "(2, 3)"; the scalar shape renders as "()".
[[nodiscard]] std::string shape_string(const Shape& shape);

namespace detail {

/// For every element of an array of shape `to` (row-major), the flat offset
/// of the element of an array of shape `from` that broadcasts onto it.
/// Precondition: `from` broadcasts to `to`.
[[nodiscard]] std::vector<Index> broadcast_offsets(const Shape& from, const Shape& to);

} // namespace detail

// ─── NDArray ──────────────────────────────────────────────────────────────────

class NDArray {
public:
    /// Scalar zero.
    NDArray();

    /// Scalar-backed value. Implicit so plain numbers mix with arrays.
    NDArray(double scalar);

    /// One-dimensional array of the given values.
    NDArray(std::initializer_list<double> values);

    /// Array of `shape` over `data` (row-major).
    /// Throws ShapeMismatch if `data.size()` differs from the element count.
    NDArray(Shape shape, Eigen::ArrayXd data);

    // ── Factories ────────────────────────────────────────────────────────────

    [[nodiscard]] static NDArray zeros(Shape shape);
    [[nodiscard]] static NDArray full(Shape shape, double value);
    [[nodiscard]] static NDArray zeros_like(const NDArray& other);

    /// One-dimensional array copied from `values`.
    [[nodiscard]] static NDArray from_vector(const std::vector<double>& values);

    /// Join arrays along an existing axis. All parts must agree on every
    /// other extent; scalars cannot be concatenated.
    [[nodiscard]] static NDArray concatenate(std::span<const NDArray> parts,
                                             Index axis = 0);

    // ── Introspection ────────────────────────────────────────────────────────

    [[nodiscard]] const Shape& shape() const noexcept;
    [[nodiscard]] Index rank() const noexcept;
    [[nodiscard]] Index size() const noexcept;
    [[nodiscard]] bool is_scalar() const noexcept;

    /// Extent of the leading axis. Throws IndexingUnsupported for scalars.
    [[nodiscard]] Index length() const;

    /// Flat row-major element buffer.
    [[nodiscard]] const Eigen::ArrayXd& values() const noexcept;

    /// Mutable flat buffer; writes are visible through every alias.
    [[nodiscard]] Eigen::ArrayXd& values() noexcept;

    /// Element at a flat offset. Throws IndexingUnsupported when out of range.
    [[nodiscard]] double at(Index flat) const;

    /// The single element of a size-1 array.
    /// Throws ConversionUnsupported for any other size.
    [[nodiscard]] double item() const;

    [[nodiscard]] std::vector<double> to_vector() const;

    // ── Storage ──────────────────────────────────────────────────────────────

    /// Deep copy with its own storage.
    [[nodiscard]] NDArray copy() const;

    [[nodiscard]] bool shares_storage_with(const NDArray& other) const noexcept;

    /// Overwrite every element in place with `source` broadcast to this
    /// array's shape. Throws ShapeMismatch if it does not broadcast.
    void assign(const NDArray& source);

    // ── Shape Manipulation ───────────────────────────────────────────────────

    /// Reshape in place: every alias observes the new shape.
    /// One extent may be -1 and is inferred.
    void set_shape(Shape shape);

    /// Reshaped copy. One extent may be -1 and is inferred.
    [[nodiscard]] NDArray reshape(Shape shape) const;

    [[nodiscard]] NDArray ravel() const;

    /// Reverse the axis order.
    [[nodiscard]] NDArray transpose() const;

    /// Permute axes; `axes` must be a permutation of 0..rank-1.
    [[nodiscard]] NDArray transpose(const Shape& axes) const;

    /// Drop every axis of extent 1.
    [[nodiscard]] NDArray squeeze() const;

    /// Insert an axis of extent 1 at `axis` (negative counts from the end).
    [[nodiscard]] NDArray expand_dims(Index axis) const;

    /// Reverse the element order along `axis`, or along every axis.
    [[nodiscard]] NDArray flip(std::optional<Index> axis = std::nullopt) const;

    [[nodiscard]] NDArray broadcast_to(const Shape& shape) const;

    // ── Indexing ─────────────────────────────────────────────────────────────

    /// Basic indexing. Integer items drop their axis, slice items keep it.
    /// Throws IndexingUnsupported for scalars, too many items, positions out
    /// of range, or a zero slice step.
    [[nodiscard]] NDArray index(const Key& key) const;

    /// Scatter `value` (broadcast to the selection) into the positions
    /// selected by `key`.
    void assign(const Key& key, const NDArray& value);

    /// Write `values` at the given flat positions, cycling through `values`
    /// when it is shorter than `flat_indices`.
    void put(std::span<const Index> flat_indices, const NDArray& values);

    void fill(double value);

    // ── Elementwise ──────────────────────────────────────────────────────────

    [[nodiscard]] NDArray clip(std::optional<double> lo,
                               std::optional<double> hi) const;

    /// Insertion position of `v` in a sorted one-dimensional array.
    [[nodiscard]] Index searchsorted(double v, Side side = Side::left) const;

    /// Apply `f` to every element.
    template <typename F>
    [[nodiscard]] NDArray map(F&& f) const {
        return NDArray(shape(), values().unaryExpr(std::forward<F>(f)).eval());
    }

    /// Combine two arrays elementwise under numpy broadcasting.
    template <typename F>
    [[nodiscard]] static NDArray zip(const NDArray& a, const NDArray& b, F&& f) {
        if (a.shape() == b.shape()) {
            return NDArray(a.shape(), a.values().binaryExpr(b.values(), std::forward<F>(f)).eval());
        }
        const Shape out = broadcast_shapes(a.shape(), b.shape());
        const auto ia = detail::broadcast_offsets(a.shape(), out);
        const auto ib = detail::broadcast_offsets(b.shape(), out);
        Eigen::ArrayXd result(static_cast<Index>(ia.size()));
        for (std::size_t k = 0; k < ia.size(); ++k) {
            result(static_cast<Index>(k)) = f(a.values()(ia[k]), b.values()(ib[k]));
        }
        return NDArray(out, std::move(result));
    }

    // ── Reductions ───────────────────────────────────────────────────────────

    /// Sum of all elements (scalar result) or along one axis.
    [[nodiscard]] NDArray sum(std::optional<Index> axis = std::nullopt) const;

    /// Arithmetic mean of all elements or along one axis.
    [[nodiscard]] NDArray mean(std::optional<Index> axis = std::nullopt) const;

    /// Number of elements folded into each output of a reduction.
    [[nodiscard]] Index reduced_count(std::optional<Index> axis = std::nullopt) const;

    [[nodiscard]] double min() const;
    [[nodiscard]] double max() const;
    [[nodiscard]] double prod() const;
    [[nodiscard]] Index argmin() const;
    [[nodiscard]] Index argmax() const;

    /// Running sum over the flattened array.
    [[nodiscard]] NDArray cumsum() const;

private:
    struct Storage {
        Shape          shape;
        Eigen::ArrayXd data;
    };

    /// Normalise a possibly negative axis against `rank`.
    static Index normalize_axis(Index axis, Index rank);

    std::shared_ptr<Storage> storage_;
};

// ─── Elementwise Operators ────────────────────────────────────────────────────

[[nodiscard]] NDArray operator+(const NDArray& a, const NDArray& b);
[[nodiscard]] NDArray operator-(const NDArray& a, const NDArray& b);
[[nodiscard]] NDArray operator*(const NDArray& a, const NDArray& b);
[[nodiscard]] NDArray operator/(const NDArray& a, const NDArray& b);
[[nodiscard]] NDArray operator-(const NDArray& a);

/// True when shapes and every element are identical (NaN never equals).
[[nodiscard]] bool array_equal(const NDArray& a, const NDArray& b);

/// True when shapes match and every element pair is within `tol`.
[[nodiscard]] bool allclose(const NDArray& a, const NDArray& b, double tol);

// ─── Mask ─────────────────────────────────────────────────────────────────────

/// Elementwise boolean result of a comparison.
///
/// Converts to `bool` only when it holds a single element; asking for the
/// truth value of a larger mask throws ConversionUnsupported.
class Mask {
public:
    using Bits = Eigen::Array<bool, Eigen::Dynamic, 1>;

    Mask(Shape shape, Bits bits);

    /// Compare two arrays elementwise under broadcasting.
    template <typename F>
    [[nodiscard]] static Mask compare(const NDArray& a, const NDArray& b, F&& f) {
        const Shape out = broadcast_shapes(a.shape(), b.shape());
        const auto ia = detail::broadcast_offsets(a.shape(), out);
        const auto ib = detail::broadcast_offsets(b.shape(), out);
        Bits bits(static_cast<Index>(ia.size()));
        for (std::size_t k = 0; k < ia.size(); ++k) {
            bits(static_cast<Index>(k)) = f(a.values()(ia[k]), b.values()(ib[k]));
        }
        return Mask(out, std::move(bits));
    }

    [[nodiscard]] const Shape& shape() const noexcept { return shape_; }
    [[nodiscard]] Index size() const noexcept { return bits_.size(); }
    [[nodiscard]] bool all() const noexcept { return bits_.all(); }
    [[nodiscard]] bool any() const noexcept { return bits_.any(); }

    /// Element at a flat offset. Throws IndexingUnsupported when out of range.
    [[nodiscard]] bool operator[](Index flat) const;

    [[nodiscard]] Mask operator!() const;

    explicit operator bool() const;

private:
    Shape shape_;
    Bits  bits_;
};

} // namespace aunc
