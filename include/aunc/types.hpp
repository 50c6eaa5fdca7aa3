#pragma once

/// @file include/aunc/types.hpp
/// @brief Shared primitive types for the aunc value-with-uncertainty library.
///
/// Every module includes this file. It defines the index, shape and key
/// vocabulary used by the array boundary (NDArray) and by Uncertainty.

#include <Eigen/Dense>

#include <optional>
#include <variant>
#include <vector>

namespace aunc {

/// Signed index type, shared with Eigen so flat offsets never need casting.
using Index = Eigen::Index;

/// Extents of an n-dimensional value. The empty shape denotes a scalar.
using Shape = std::vector<Index>;

// ─── Indexing Keys ────────────────────────────────────────────────────────────

/// A slice `start:stop:step` along one axis.
///
/// Omitted bounds follow the usual rules: the whole axis for a positive
/// step, the whole axis reversed for a negative one. Negative bounds count
/// from the end of the axis.
struct Slice {
    std::optional<Index> start;
    std::optional<Index> stop;
    Index                step = 1;
};

/// One item of an indexing key: either a single position or a slice.
using KeyItem = std::variant<Index, Slice>;

/// A basic-indexing key, one item per leading axis.
/// Axes beyond the key's length are taken whole.
using Key = std::vector<KeyItem>;

/// Side selector for `searchsorted`.
enum class Side {
    left,
    right,
};

} // namespace aunc
