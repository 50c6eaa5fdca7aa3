#pragma once

/// @file include/aunc/uncertainty.hpp
/// @brief Uncertainty: a nominal value paired with its standard deviation.
///
/// # Module: Uncertainty Value
///
/// ## Responsibility
/// Hold a nominal NDArray and an error NDArray of identical shape and give
/// them numeric behaviour:
///   - arithmetic with first-order propagation of independent errors
///   - comparisons on the nominal value only
///   - conversions, indexing, iteration and the array protocol
///
/// ## Usage
/// ```cpp
/// aunc::Uncertainty a(2.0, 0.1);
/// aunc::Uncertainty b(2.0, 0.1);
/// auto q = a / b;                       // 1 +/- 0.0707...
/// fmt::print("{}\n", aunc::to_string(q));
///
/// aunc::Uncertainty v({1.0, 2.0, 3.0}, {0.1, 0.1, 0.1});
/// v += a;                               // writes into v's buffers
/// ```
///
/// ## Storage
/// Copies of an Uncertainty alias the same nominal and error buffers.
/// In-place operators on an *array-backed* value (rank ≥ 1) write into
/// those buffers, so every alias observes the change. A *scalar-backed*
/// value (rank 0) is rebound instead and its other copies keep the old
/// value. `copy()` detaches.
///
/// ## Guarantees
/// - `shape(value()) == shape(error())` at all times
/// - No negative error element (NaN tolerated)
/// - Not internally synchronised

#include "aunc/config.hpp"
#include "aunc/ndarray.hpp"
#include "aunc/types.hpp"

#include <complex>
#include <cstddef>
#include <iterator>
#include <span>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace aunc {

struct UncertaintyList;

// ─── Uncertainty ──────────────────────────────────────────────────────────────

class Uncertainty {
public:
    class Iterator;

    /// Pair a nominal value with its error. Both arrays are kept by
    /// reference, not copied.
    ///
    /// # Errors
    /// - ShapeMismatch if the shapes differ
    /// - NegativeErrorValue if any error element is negative
    Uncertainty(NDArray nominal, NDArray error);

    /// Scalar-backed value.
    Uncertainty(double nominal, double error);

    /// One-dimensional value assembled from scalar items, order preserved.
    /// Throws TypeMismatch if any item is not scalar-backed.
    [[nodiscard]] static Uncertainty from_sequence(std::span<const Uncertainty> items);

    // ── Accessors ────────────────────────────────────────────────────────────

    [[nodiscard]] const NDArray& value() const noexcept { return nominal_; }
    [[nodiscard]] const NDArray& nominal_value() const noexcept { return nominal_; }
    [[nodiscard]] const NDArray& error() const noexcept { return error_; }
    [[nodiscard]] const NDArray& std_dev() const noexcept { return error_; }

    /// error / nominal elementwise; NaN where the nominal is zero.
    [[nodiscard]] NDArray relative() const;
    [[nodiscard]] NDArray rel() const { return relative(); }

    [[nodiscard]] const Shape& shape() const noexcept { return nominal_.shape(); }
    [[nodiscard]] Index size() const noexcept { return nominal_.size(); }
    [[nodiscard]] Index rank() const noexcept { return nominal_.rank(); }
    [[nodiscard]] bool is_scalar() const noexcept { return nominal_.is_scalar(); }

    /// Extent of the leading axis. Throws IndexingUnsupported for scalars.
    [[nodiscard]] Index length() const { return nominal_.length(); }

    /// Reshape both buffers in place; one extent may be -1.
    void set_shape(Shape shape);

    /// Deep copy with detached buffers.
    [[nodiscard]] Uncertainty copy() const;

    [[nodiscard]] bool shares_storage_with(const Uncertainty& other) const noexcept;

    // ── Conversions ──────────────────────────────────────────────────────────
    //
    // The scalar conversions read the nominal of a single-element value and
    // throw ConversionUnsupported otherwise. They never warn.

    [[nodiscard]] double to_double() const;

    /// Nominal truncated toward zero.
    [[nodiscard]] long long to_int() const;

    [[nodiscard]] std::complex<double> to_complex() const;

    explicit operator double() const { return to_double(); }
    explicit operator bool() const;

    /// Downcast to the plain nominal array, discarding the error.
    ///
    /// # Returns
    /// The nominal NDArray itself (same storage).
    ///
    /// # Errors
    /// DowncastError when `policy` is `raise`. Under `warn` a
    /// `WarningKind::downcast` warning is emitted.
    [[nodiscard]] NDArray to_array(DowncastPolicy policy = DowncastPolicy::warn) const;

    // ── Indexing ─────────────────────────────────────────────────────────────

    /// Index nominal and error with the same key.
    /// Throws IndexingUnsupported when the nominal rejects the key.
    [[nodiscard]] Uncertainty get(const Key& key) const;

    [[nodiscard]] Uncertainty operator[](Index i) const;

    /// Write `value` (broadcast to the selection) into both buffers.
    void set(const Key& key, const Uncertainty& value);

    /// Always throws TypeMismatch: only an Uncertainty can be stored.
    void set(const Key& key, const NDArray& value);

    // ── Iteration ────────────────────────────────────────────────────────────

    /// Iterate the leading axis. Throws IndexingUnsupported for scalars.
    [[nodiscard]] Iterator begin() const;
    [[nodiscard]] Iterator end() const;

    /// One scalar-backed Uncertainty per element, row-major.
    [[nodiscard]] std::vector<Uncertainty> flat() const;

    // ── Array Protocol ───────────────────────────────────────────────────────

    /// Clip the nominal to [lo, hi]; the error is carried unchanged.
    [[nodiscard]] Uncertainty clip(std::optional<double> lo, std::optional<double> hi) const;

    /// Set every nominal element to `value`; the error is left untouched.
    void fill(double value);

    /// Set every element to a single-element Uncertainty, nominal and error.
    void fill(const Uncertainty& value);

    /// Always throws TypeMismatch.
    void fill(const NDArray& values);

    /// Write `values` at flat positions of both buffers, cycling `values`.
    ///
    /// # Errors
    /// - AttributeUnavailable for a scalar-backed receiver
    /// - IndexingUnsupported for a position out of range
    void put(std::span<const Index> flat_indices, const Uncertainty& values);

    /// Always throws TypeMismatch.
    void put(std::span<const Index> flat_indices, const NDArray& values);

    [[nodiscard]] Uncertainty real() const;

    /// Zero nominal and zero error: values are real.
    [[nodiscard]] Uncertainty imag() const;

    [[nodiscard]] Uncertainty transpose() const;
    [[nodiscard]] Uncertainty T() const { return transpose(); }

    /// Insertion position of `v` in the (sorted, one-dimensional) nominal.
    [[nodiscard]] Index searchsorted(double v, Side side = Side::left) const;

    /// Nested list of scalar-backed values; a scalar yields itself.
    [[nodiscard]] UncertaintyList tolist() const;

    /// Evaluate a forwarded nominal-array method by name.
    ///
    /// Known names: sum, mean, min, max, prod, argmin, argmax, cumsum,
    /// ravel, flatten. The result is a plain array computed on the nominal
    /// only (positions for argmin/argmax).
    ///
    /// # Errors
    /// AttributeUnavailable for `__array_*` names and for any unknown name.
    [[nodiscard]] NDArray attribute(std::string_view name) const;

    // ── In-Place Arithmetic ──────────────────────────────────────────────────
    //
    // Array-backed receivers are updated in their existing buffers; the
    // result must keep the receiver's shape (ShapeMismatch otherwise).
    // Scalar-backed receivers are rebound.

    Uncertainty& operator+=(const Uncertainty& other);
    Uncertainty& operator+=(const NDArray& other);
    Uncertainty& operator-=(const Uncertainty& other);
    Uncertainty& operator-=(const NDArray& other);
    Uncertainty& operator*=(const Uncertainty& other);
    Uncertainty& operator*=(const NDArray& other);
    Uncertainty& operator/=(const Uncertainty& other);
    Uncertainty& operator/=(const NDArray& other);
    Uncertainty& operator%=(const Uncertainty& other);
    Uncertainty& operator%=(const NDArray& other);

private:
    Uncertainty& update_in_place(Uncertainty result);

    NDArray nominal_;
    NDArray error_;
};

// ─── Iterator ─────────────────────────────────────────────────────────────────

/// Input iterator over the leading axis; each step yields a fresh value.
class Uncertainty::Iterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = Uncertainty;
    using difference_type   = std::ptrdiff_t;
    using pointer           = void;
    using reference         = Uncertainty;

    Iterator(const Uncertainty* owner, Index position) noexcept
        : owner_(owner), position_(position) {}

    [[nodiscard]] Uncertainty operator*() const { return (*owner_)[position_]; }

    Iterator& operator++() noexcept {
        ++position_;
        return *this;
    }

    Iterator operator++(int) noexcept {
        Iterator previous = *this;
        ++position_;
        return previous;
    }

    [[nodiscard]] bool operator==(const Iterator& other) const noexcept {
        return owner_ == other.owner_ && position_ == other.position_;
    }

private:
    const Uncertainty* owner_;
    Index              position_;
};

// ─── UncertaintyList ──────────────────────────────────────────────────────────

/// Result of `tolist()`: a scalar value or a list of nested lists.
struct UncertaintyList {
    std::variant<Uncertainty, std::vector<UncertaintyList>> node;

    [[nodiscard]] bool is_leaf() const noexcept {
        return std::holds_alternative<Uncertainty>(node);
    }
    [[nodiscard]] const Uncertainty& leaf() const { return std::get<Uncertainty>(node); }
    [[nodiscard]] const std::vector<UncertaintyList>& items() const {
        return std::get<std::vector<UncertaintyList>>(node);
    }
};

// ─── Arithmetic ───────────────────────────────────────────────────────────────
//
// A plain NDArray (or a double, via NDArray's implicit constructor) acts as
// an operand with zero error.

[[nodiscard]] Uncertainty operator+(const Uncertainty& x, const Uncertainty& y);
[[nodiscard]] Uncertainty operator+(const Uncertainty& x, const NDArray& y);
[[nodiscard]] Uncertainty operator+(const NDArray& x, const Uncertainty& y);

[[nodiscard]] Uncertainty operator-(const Uncertainty& x, const Uncertainty& y);
[[nodiscard]] Uncertainty operator-(const Uncertainty& x, const NDArray& y);
[[nodiscard]] Uncertainty operator-(const NDArray& x, const Uncertainty& y);

[[nodiscard]] Uncertainty operator*(const Uncertainty& x, const Uncertainty& y);
[[nodiscard]] Uncertainty operator*(const Uncertainty& x, const NDArray& y);
[[nodiscard]] Uncertainty operator*(const NDArray& x, const Uncertainty& y);

[[nodiscard]] Uncertainty operator/(const Uncertainty& x, const Uncertainty& y);
[[nodiscard]] Uncertainty operator/(const Uncertainty& x, const NDArray& y);
[[nodiscard]] Uncertainty operator/(const NDArray& x, const Uncertainty& y);

/// Modulo (sign of the divisor) with zero error.
[[nodiscard]] Uncertainty operator%(const Uncertainty& x, const Uncertainty& y);
[[nodiscard]] Uncertainty operator%(const Uncertainty& x, const NDArray& y);
[[nodiscard]] Uncertainty operator%(const NDArray& x, const Uncertainty& y);

[[nodiscard]] Uncertainty operator-(const Uncertainty& x);
[[nodiscard]] Uncertainty operator+(const Uncertainty& x);

/// x ** y with zero error. The first-order form is the registry's `power`.
[[nodiscard]] Uncertainty pow(const Uncertainty& x, const Uncertainty& y);
[[nodiscard]] Uncertainty pow(const Uncertainty& x, const NDArray& y);
[[nodiscard]] Uncertainty pow(const NDArray& x, const Uncertainty& y);

/// ⌊x / y⌋ with zero error.
[[nodiscard]] Uncertainty floor_divide(const Uncertainty& x, const Uncertainty& y);
[[nodiscard]] Uncertainty floor_divide(const Uncertainty& x, const NDArray& y);
[[nodiscard]] Uncertainty floor_divide(const NDArray& x, const Uncertainty& y);

[[nodiscard]] Uncertainty mod(const Uncertainty& x, const Uncertainty& y);
[[nodiscard]] Uncertainty mod(const Uncertainty& x, const NDArray& y);
[[nodiscard]] Uncertainty mod(const NDArray& x, const Uncertainty& y);

/// (floor_divide(x, y), mod(x, y)).
[[nodiscard]] std::pair<Uncertainty, Uncertainty> divmod(const Uncertainty& x, const Uncertainty& y);
[[nodiscard]] std::pair<Uncertainty, Uncertainty> divmod(const Uncertainty& x, const NDArray& y);
[[nodiscard]] std::pair<Uncertainty, Uncertainty> divmod(const NDArray& x, const Uncertainty& y);

[[nodiscard]] Uncertainty abs(const Uncertainty& x);

/// Round the nominal to `ndigits` decimals, half to even; error kept.
[[nodiscard]] Uncertainty round(const Uncertainty& x, int ndigits = 0);

// ─── Comparison ───────────────────────────────────────────────────────────────
//
// Nominal values only; the error never takes part.

[[nodiscard]] Mask operator==(const Uncertainty& x, const Uncertainty& y);
[[nodiscard]] Mask operator==(const Uncertainty& x, const NDArray& y);
[[nodiscard]] Mask operator==(const NDArray& x, const Uncertainty& y);
[[nodiscard]] Mask operator!=(const Uncertainty& x, const Uncertainty& y);
[[nodiscard]] Mask operator!=(const Uncertainty& x, const NDArray& y);
[[nodiscard]] Mask operator!=(const NDArray& x, const Uncertainty& y);
[[nodiscard]] Mask operator<(const Uncertainty& x, const Uncertainty& y);
[[nodiscard]] Mask operator<(const Uncertainty& x, const NDArray& y);
[[nodiscard]] Mask operator<(const NDArray& x, const Uncertainty& y);
[[nodiscard]] Mask operator<=(const Uncertainty& x, const Uncertainty& y);
[[nodiscard]] Mask operator<=(const Uncertainty& x, const NDArray& y);
[[nodiscard]] Mask operator<=(const NDArray& x, const Uncertainty& y);
[[nodiscard]] Mask operator>(const Uncertainty& x, const Uncertainty& y);
[[nodiscard]] Mask operator>(const Uncertainty& x, const NDArray& y);
[[nodiscard]] Mask operator>(const NDArray& x, const Uncertainty& y);
[[nodiscard]] Mask operator>=(const Uncertainty& x, const Uncertainty& y);
[[nodiscard]] Mask operator>=(const Uncertainty& x, const NDArray& y);
[[nodiscard]] Mask operator>=(const NDArray& x, const Uncertainty& y);

// ─── Component Access ─────────────────────────────────────────────────────────

/// Nominal of an Uncertainty; a plain array is returned as is.
[[nodiscard]] NDArray nominal_values(const Uncertainty& x);
[[nodiscard]] NDArray nominal_values(const NDArray& x);

/// Error of an Uncertainty; zeros for a plain array.
[[nodiscard]] NDArray std_devs(const Uncertainty& x);
[[nodiscard]] NDArray std_devs(const NDArray& x);

} // namespace aunc
