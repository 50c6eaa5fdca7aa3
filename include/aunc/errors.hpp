#pragma once

/// @file include/aunc/errors.hpp
/// @brief Exception types raised by the aunc library.
///
/// Every failure the library reports is one of these types, so callers can
/// catch a single category (`UncertaintyError`) or a specific condition.

#include <stdexcept>
#include <string>
#include <utility>

namespace aunc {

/// Base error for the library.
class UncertaintyError : public std::runtime_error {
public:
    explicit UncertaintyError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

/// An error component holds at least one negative element.
class NegativeErrorValue : public UncertaintyError {
public:
    explicit NegativeErrorValue(std::string msg) : UncertaintyError(std::move(msg)) {}
};

/// Nominal and error shapes differ, operands do not broadcast, or a reshape
/// changes the element count.
class ShapeMismatch : public UncertaintyError {
public:
    explicit ShapeMismatch(std::string msg) : UncertaintyError(std::move(msg)) {}
};

/// The nominal container rejected an indexing key.
class IndexingUnsupported : public UncertaintyError {
public:
    explicit IndexingUnsupported(std::string msg) : UncertaintyError(std::move(msg)) {}
};

/// An argument has the wrong kind (e.g. a plain array where an Uncertainty
/// is required).
class TypeMismatch : public UncertaintyError {
public:
    explicit TypeMismatch(std::string msg) : UncertaintyError(std::move(msg)) {}
};

/// Attribute is not part of the forwarded capability table.
class AttributeUnavailable : public UncertaintyError {
public:
    explicit AttributeUnavailable(std::string msg) : UncertaintyError(std::move(msg)) {}
};

/// No propagation rule is registered for the requested operation.
class UnsupportedOperation : public UncertaintyError {
public:
    explicit UnsupportedOperation(std::string msg) : UncertaintyError(std::move(msg)) {}
};

/// An elementwise call used a broadcasting mode other than a plain call.
class UnsupportedBroadcastMode : public UncertaintyError {
public:
    explicit UnsupportedBroadcastMode(std::string msg) : UncertaintyError(std::move(msg)) {}
};

/// A value cannot be converted to the requested representation.
class ConversionUnsupported : public UncertaintyError {
public:
    explicit ConversionUnsupported(std::string msg) : UncertaintyError(std::move(msg)) {}
};

/// Downcasting to a plain array while the downcast policy forbids it.
class DowncastError : public UncertaintyError {
public:
    explicit DowncastError(std::string msg) : UncertaintyError(std::move(msg)) {}
};

} // namespace aunc
