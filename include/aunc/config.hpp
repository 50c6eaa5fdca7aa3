#pragma once

/// @file include/aunc/config.hpp
/// @brief Configuration types for conversions, display and dispatch.

#include <optional>

namespace aunc {

// ─── DowncastPolicy ───────────────────────────────────────────────────────────

/// What happens when an Uncertainty is downcast to a plain nominal array.
enum class DowncastPolicy {
    warn,   ///< Return the nominal array and emit a downcast warning
    raise,  ///< Throw DowncastError
    silent, ///< Return the nominal array without a warning
};

// ─── DisplayOptions ───────────────────────────────────────────────────────────

/// Presentation options for `to_string`.
struct DisplayOptions {
    /// Fixed number of decimals for nominal and error.
    /// `nullopt` prints the shortest round-trip representation.
    std::optional<int> precision;
};

// ─── DispatchConfig ───────────────────────────────────────────────────────────

/// Configuration parameters for the Dispatcher.
struct DispatchConfig {
    /// Policy applied when a dispatched rule needs a plain nominal array.
    DowncastPolicy downcast = DowncastPolicy::warn;

    /// If true, trace every dispatch decision to stderr.
    bool verbose = false;
};

} // namespace aunc
