#pragma once

/// @file include/aunc/diagnostics.hpp
/// @brief User-visible warnings and their process-wide handler.
///
/// Warnings go to a replaceable handler. The default handler prints
/// `[aunc] warning: <message>` to stderr via {fmt}.
///
/// The handler is process-wide and not synchronised; install and remove
/// handlers from a single thread.

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace aunc::diagnostics {

/// Category of a warning.
enum class WarningKind {
    downcast, ///< Error information discarded by converting to a plain array
};

[[nodiscard]] std::string_view to_string(WarningKind kind) noexcept;

using WarningHandler = std::function<void(WarningKind, std::string_view)>;

/// Emit a warning through the current handler.
void warn(WarningKind kind, std::string_view message);

/// Replace the current handler; returns the previous one.
/// An empty handler restores the default stderr handler.
WarningHandler set_warning_handler(WarningHandler handler);

/// Records every warning emitted during its lifetime instead of printing it,
/// then restores the previous handler.
///
/// # Example
/// ```cpp
/// aunc::diagnostics::ScopedWarningCapture capture;
/// auto nominal = u.to_array();
/// assert(capture.count(WarningKind::downcast) == 1);
/// ```
class ScopedWarningCapture {
public:
    struct Record {
        WarningKind kind;
        std::string message;
    };

    ScopedWarningCapture();
    ~ScopedWarningCapture();

    ScopedWarningCapture(const ScopedWarningCapture&)            = delete;
    ScopedWarningCapture& operator=(const ScopedWarningCapture&) = delete;

    [[nodiscard]] const std::vector<Record>& records() const noexcept { return records_; }
    [[nodiscard]] std::size_t count(WarningKind kind) const noexcept;

private:
    std::vector<Record> records_;
    WarningHandler      previous_;
};

} // namespace aunc::diagnostics
