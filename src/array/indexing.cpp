/// @file src/array/indexing.cpp
/// @brief Basic indexing, scatter and put for NDArray.
///
/// Keys follow the usual slice semantics: negative positions count from the end
/// of the axis, slice bounds are clamped, and a negative step walks the axis
/// backwards. Integer items drop their axis from the result.

#include "aunc/ndarray.hpp"
#include "aunc/errors.hpp"

#include "array/strides.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace aunc {

namespace {

struct SliceRange {
    Index start;
    Index count;
    Index step;
};

SliceRange resolve_slice(const Slice& s, Index n) {
    if (s.step == 0) {
        throw IndexingUnsupported("slice step cannot be zero");
    }

    const Index step = s.step;
    Index start = 0;
    Index stop  = 0;
    Index count = 0;

    if (step > 0) {
        start = s.start.value_or(0);
        stop  = s.stop.value_or(n);
        if (start < 0) start += n;
        if (stop < 0)  stop  += n;
        start = std::clamp(start, Index{0}, n);
        stop  = std::clamp(stop,  Index{0}, n);
        count = stop > start ? (stop - start + step - 1) / step : 0;
    } else {
        // -1 stands for "before the first element" once bounds are resolved.
        start = s.start ? (*s.start < 0 ? *s.start + n : *s.start) : n - 1;
        stop  = s.stop  ? (*s.stop  < 0 ? *s.stop  + n : *s.stop)  : -1;
        start = std::clamp(start, Index{-1}, n - 1);
        stop  = std::clamp(stop,  Index{-1}, n - 1);
        count = start > stop ? (start - stop - step - 1) / (-step) : 0;
    }
    return SliceRange{start, count, step};
}

} // namespace

namespace detail {

Selection select(const Shape& shape, const Key& key) {
    if (shape.empty()) {
        throw IndexingUnsupported("scalar values do not support indexing");
    }
    if (key.size() > shape.size()) {
        throw IndexingUnsupported(fmt::format(
            "too many indices: array is {}-dimensional, but {} were indexed",
            shape.size(), key.size()));
    }

    const Shape strides = row_major_strides(shape);
    Shape out_shape;
    Shape steps;
    Index base = 0;

    for (std::size_t d = 0; d < shape.size(); ++d) {
        const Index n = shape[d];

        if (d >= key.size()) {
            out_shape.push_back(n);
            steps.push_back(strides[d]);
            continue;
        }

        if (const auto* pos = std::get_if<Index>(&key[d])) {
            const Index i = *pos < 0 ? *pos + n : *pos;
            if (i < 0 || i >= n) {
                throw IndexingUnsupported(fmt::format(
                    "index {} is out of bounds for axis {} with size {}", *pos, d, n));
            }
            base += i * strides[d];
        } else {
            const auto range = resolve_slice(std::get<Slice>(key[d]), n);
            if (range.count > 0) {
                base += range.start * strides[d];
            }
            out_shape.push_back(range.count);
            steps.push_back(range.step * strides[d]);
        }
    }

    auto offsets = gather_offsets(out_shape, steps, base);
    return Selection{std::move(out_shape), std::move(offsets)};
}

} // namespace detail

// ─── NDArray Indexing ─────────────────────────────────────────────────────────

NDArray NDArray::index(const Key& key) const {
    const auto sel = detail::select(shape(), key);
    Eigen::ArrayXd data(static_cast<Index>(sel.offsets.size()));
    for (std::size_t k = 0; k < sel.offsets.size(); ++k) {
        data(static_cast<Index>(k)) = values()(sel.offsets[k]);
    }
    return NDArray(sel.shape, std::move(data));
}

void NDArray::assign(const Key& key, const NDArray& value) {
    const auto    sel      = detail::select(shape(), key);
    const NDArray expanded = value.broadcast_to(sel.shape);
    for (std::size_t k = 0; k < sel.offsets.size(); ++k) {
        storage_->data(sel.offsets[k]) = expanded.values()(static_cast<Index>(k));
    }
}

void NDArray::put(std::span<const Index> flat_indices, const NDArray& values_in) {
    if (flat_indices.empty()) return;
    if (values_in.size() == 0) {
        throw ShapeMismatch("cannot put an empty sequence of values");
    }
    // Validate every position before writing so a bad index leaves the
    // array untouched.
    std::vector<Index> resolved;
    resolved.reserve(flat_indices.size());
    for (const Index raw : flat_indices) {
        const Index i = raw < 0 ? raw + size() : raw;
        if (i < 0 || i >= size()) {
            throw IndexingUnsupported(fmt::format(
                "index {} is out of bounds for size {}", raw, size()));
        }
        resolved.push_back(i);
    }
    const NDArray source = values_in.copy();
    for (std::size_t k = 0; k < resolved.size(); ++k) {
        storage_->data(resolved[k]) = source.values()(static_cast<Index>(k) % source.size());
    }
}

} // namespace aunc
