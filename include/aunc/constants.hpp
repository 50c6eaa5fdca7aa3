#pragma once

#include <string_view>

/// @file include/aunc/constants.hpp
/// @brief Numeric and presentation constants for the aunc library.

namespace aunc::constants {

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon used by tests and self-checks.
static constexpr double FLOAT_EPSILON = 1e-12;

// ─── Presentation ─────────────────────────────────────────────────────────────

/// Separator between nominal value and error in the string representation.
static constexpr std::string_view PLUS_MINUS = " +/- ";

/// Prefix of every message written by the default warning handler.
static constexpr std::string_view WARNING_PREFIX = "[aunc] warning: ";

// ─── Array Protocol ───────────────────────────────────────────────────────────

/// Attribute names starting with this prefix belong to the host array
/// protocol and are never forwarded to the nominal value.
static constexpr std::string_view ARRAY_PROTOCOL_PREFIX = "__array_";

} // namespace aunc::constants
