#pragma once

/// @file include/aunc/format.hpp
/// @brief Text and byte representations of NDArray and Uncertainty.
///
/// An Uncertainty renders as `"{nominal} +/- {error}"`. Arrays render as
/// nested bracketed lists, e.g. `[1.5, 2.5] +/- [0.5, 0.5]`.
///
/// Both types have `fmt::formatter` specialisations that accept the
/// floating-point format spec, applied to every element:
/// ```cpp
/// fmt::print("{:.3f}\n", aunc::Uncertainty(2.0, 0.1)); // 2.000 +/- 0.100
/// ```

#include "aunc/config.hpp"
#include "aunc/constants.hpp"
#include "aunc/ndarray.hpp"
#include "aunc/uncertainty.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <vector>

namespace aunc {

/// Render with the given display options (default: shortest round-trip).
[[nodiscard]] std::string to_string(const NDArray& a, const DisplayOptions& options = {});
[[nodiscard]] std::string to_string(const Uncertainty& u, const DisplayOptions& options = {});

/// UTF-8 encoding of `to_string(u)`.
[[nodiscard]] std::vector<std::byte> to_bytes(const Uncertainty& u);

namespace detail {

template <typename FormatContext>
auto format_axis(const NDArray& a, std::size_t axis, Index& offset, FormatContext& ctx,
                 const fmt::formatter<double>& element) -> decltype(ctx.out()) {
    auto out = fmt::format_to(ctx.out(), "[");
    const Index n = a.shape()[axis];
    for (Index i = 0; i < n; ++i) {
        if (i > 0) out = fmt::format_to(out, ", ");
        ctx.advance_to(out);
        if (axis + 1 == a.shape().size()) {
            out = element.format(a.values()(offset++), ctx);
        } else {
            out = format_axis(a, axis + 1, offset, ctx, element);
        }
    }
    return fmt::format_to(out, "]");
}

/// Write every element of `a` through `element`, nested by axis.
template <typename FormatContext>
auto format_elements(const NDArray& a, FormatContext& ctx,
                     const fmt::formatter<double>& element) -> decltype(ctx.out()) {
    if (a.is_scalar()) {
        return element.format(a.values()(0), ctx);
    }
    Index offset = 0;
    return format_axis(a, 0, offset, ctx, element);
}

} // namespace detail

} // namespace aunc

// ─── fmt Integration ──────────────────────────────────────────────────────────

template <>
struct fmt::formatter<aunc::NDArray> : fmt::formatter<double> {
    template <typename FormatContext>
    auto format(const aunc::NDArray& a, FormatContext& ctx) const -> decltype(ctx.out()) {
        return aunc::detail::format_elements(a, ctx, *this);
    }
};

template <>
struct fmt::formatter<aunc::Uncertainty> : fmt::formatter<double> {
    template <typename FormatContext>
    auto format(const aunc::Uncertainty& u, FormatContext& ctx) const -> decltype(ctx.out()) {
        auto out = aunc::detail::format_elements(u.value(), ctx, *this);
        out = fmt::format_to(out, "{}", aunc::constants::PLUS_MINUS);
        ctx.advance_to(out);
        return aunc::detail::format_elements(u.error(), ctx, *this);
    }
};
