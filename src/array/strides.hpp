#pragma once

/// @file src/array/strides.hpp
/// @brief Internal row-major stride arithmetic shared by the NDArray sources.

#include "aunc/types.hpp"

#include <vector>

namespace aunc::detail {

/// Row-major element strides for `shape` (the innermost axis has stride 1).
[[nodiscard]] Shape row_major_strides(const Shape& shape);

/// Flat offsets visited when walking an output of `out_shape` row-major,
/// starting at `base` and advancing by `steps[d]` along axis d.
[[nodiscard]] std::vector<Index> gather_offsets(const Shape& out_shape,
                                                const Shape& steps,
                                                Index        base);

/// Resolve a requested shape (one extent may be -1) against `size` elements.
/// Throws ShapeMismatch when the element counts cannot agree.
[[nodiscard]] Shape resolve_shape(const Shape& requested, Index size);

/// Positions picked out of an array by a basic-indexing key.
struct Selection {
    Shape              shape;   ///< Shape of the selected sub-array
    std::vector<Index> offsets; ///< Flat source offsets, row-major in `shape`
};

/// Resolve `key` against an array of `shape`.
/// Throws IndexingUnsupported when the key is rejected.
[[nodiscard]] Selection select(const Shape& shape, const Key& key);

} // namespace aunc::detail
