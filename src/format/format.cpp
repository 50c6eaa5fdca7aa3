/// @file src/format/format.cpp
/// @brief String and byte representations.

#include "aunc/format.hpp"

#include <algorithm>

namespace aunc {

namespace {

template <typename T>
std::string render(const T& value, const DisplayOptions& options) {
    if (options.precision) {
        return fmt::format(fmt::runtime(fmt::format("{{:.{}f}}", *options.precision)), value);
    }
    return fmt::format("{}", value);
}

} // namespace

std::string to_string(const NDArray& a, const DisplayOptions& options) {
    return render(a, options);
}

std::string to_string(const Uncertainty& u, const DisplayOptions& options) {
    return render(u, options);
}

std::vector<std::byte> to_bytes(const Uncertainty& u) {
    const std::string text = to_string(u);
    std::vector<std::byte> bytes(text.size());
    std::transform(text.begin(), text.end(), bytes.begin(),
                   [](char c) { return static_cast<std::byte>(c); });
    return bytes;
}

} // namespace aunc
