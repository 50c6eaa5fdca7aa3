/// @file src/diagnostics/diagnostics.cpp
/// @brief Warning emission and the default stderr handler.

#include "aunc/diagnostics.hpp"
#include "aunc/constants.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cstdio>
#include <utility>

namespace aunc::diagnostics {

namespace {

void print_to_stderr(WarningKind kind, std::string_view message) {
    fmt::print(stderr, "{}{} ({})\n", constants::WARNING_PREFIX, message, to_string(kind));
}

WarningHandler& current_handler() {
    static WarningHandler handler = print_to_stderr;
    return handler;
}

} // namespace

std::string_view to_string(WarningKind kind) noexcept {
    switch (kind) {
        case WarningKind::downcast: return "downcast";
    }
    return "unknown";
}

void warn(WarningKind kind, std::string_view message) {
    current_handler()(kind, message);
}

WarningHandler set_warning_handler(WarningHandler handler) {
    WarningHandler previous = std::move(current_handler());
    current_handler() = handler ? std::move(handler) : WarningHandler(print_to_stderr);
    return previous;
}

// ─── ScopedWarningCapture ─────────────────────────────────────────────────────

ScopedWarningCapture::ScopedWarningCapture()
    : previous_(set_warning_handler([this](WarningKind kind, std::string_view message) {
          records_.push_back(Record{kind, std::string(message)});
      })) {}

ScopedWarningCapture::~ScopedWarningCapture() {
    set_warning_handler(std::move(previous_));
}

std::size_t ScopedWarningCapture::count(WarningKind kind) const noexcept {
    return static_cast<std::size_t>(std::count_if(records_.begin(), records_.end(),
        [kind](const Record& r) { return r.kind == kind; }));
}

} // namespace aunc::diagnostics
