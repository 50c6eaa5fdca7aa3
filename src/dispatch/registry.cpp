/// @file src/dispatch/registry.cpp
/// @brief OperationRegistry storage and the rule helpers.

#include "aunc/registry.hpp"

#include <algorithm>

namespace aunc {

std::string_view to_string(CallKind kind) noexcept {
    switch (kind) {
        case CallKind::function: return "function";
        case CallKind::ufunc:    return "ufunc";
    }
    return "unknown";
}

std::string_view to_string(UfuncMethod method) noexcept {
    switch (method) {
        case UfuncMethod::call:       return "__call__";
        case UfuncMethod::reduce:     return "reduce";
        case UfuncMethod::accumulate: return "accumulate";
        case UfuncMethod::reduceat:   return "reduceat";
        case UfuncMethod::outer:      return "outer";
        case UfuncMethod::at:         return "at";
    }
    return "unknown";
}

bool Rule::accepts_keyword(std::string_view key) const noexcept {
    return std::find(keywords.begin(), keywords.end(), key) != keywords.end();
}

// ─── OperationRegistry ────────────────────────────────────────────────────────

void OperationRegistry::register_closed_form(CallKind kind, std::string name, Arity arity,
                                             std::vector<std::string> keywords,
                                             ClosedFormRule rule) {
    insert(Rule{std::move(name), kind, arity, std::move(keywords), std::move(rule)});
}

void OperationRegistry::register_pass_through(CallKind kind, std::string name, Arity arity,
                                              std::vector<std::string> keywords,
                                              PassThroughRule rule) {
    insert(Rule{std::move(name), kind, arity, std::move(keywords), std::move(rule)});
}

void OperationRegistry::insert(Rule rule) {
    Table& target = rule.kind == CallKind::function ? functions_ : ufuncs_;
    std::string key = rule.name;
    target.insert_or_assign(std::move(key), std::move(rule));
}

const OperationRegistry::Table& OperationRegistry::table(CallKind kind) const noexcept {
    return kind == CallKind::function ? functions_ : ufuncs_;
}

const Rule* OperationRegistry::find(CallKind kind, std::string_view name) const noexcept {
    const Table& t  = table(kind);
    const auto   it = t.find(name);
    return it == t.end() ? nullptr : &it->second;
}

std::vector<std::string> OperationRegistry::names(CallKind kind) const {
    std::vector<std::string> out;
    out.reserve(table(kind).size());
    for (const auto& [name, rule] : table(kind)) {
        out.push_back(name);
    }
    return out;
}

// ─── Rule Helpers ─────────────────────────────────────────────────────────────

std::optional<double> number_param(const Params& params, std::string_view key) {
    const auto it = params.find(key);
    if (it == params.end()) {
        return std::nullopt;
    }
    if (const auto* d = std::get_if<double>(&it->second)) {
        return *d;
    }
    if (const auto* i = std::get_if<Index>(&it->second)) {
        return static_cast<double>(*i);
    }
    throw TypeMismatch(fmt::format("parameter '{}' must be a number", key));
}

propagation::UncertaintyOperand as_uncertain(const propagation::Operand& operand) {
    if (const auto* u = std::get_if<propagation::UncertaintyOperand>(&operand)) {
        return *u;
    }
    const NDArray& value = std::get<propagation::ScalarOperand>(operand).value;
    return propagation::UncertaintyOperand{value, NDArray::zeros_like(value)};
}

NDArray as_plain(const propagation::Operand& operand, DowncastPolicy policy) {
    if (const auto* s = std::get_if<propagation::ScalarOperand>(&operand)) {
        return s->value;
    }
    const auto& u = std::get<propagation::UncertaintyOperand>(operand);
    // Reassembling validates the pair; to_array applies the policy.
    return Uncertainty(u.nominal, u.error).to_array(policy);
}

} // namespace aunc
