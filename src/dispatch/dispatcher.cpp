/// @file src/dispatch/dispatcher.cpp
/// @brief Dispatcher implementation.

#include "aunc/dispatch.hpp"
#include "aunc/errors.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cstdio>
#include <type_traits>

namespace aunc {

Dispatcher::Dispatcher(const OperationRegistry& registry, DispatchConfig config)
    : registry_(registry), config_(config) {}

std::vector<std::type_index> Dispatcher::capable_types(const Call& call) {
    std::vector<std::type_index> types;
    for (const Argument& arg : call.args) {
        std::visit([&types](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (is_uncertainty_capable<T>::value) {
                const std::type_index id(typeid(T));
                if (std::find(types.begin(), types.end(), id) == types.end()) {
                    types.push_back(id);
                }
            }
        }, arg);
    }
    return types;
}

std::optional<Uncertainty> Dispatcher::dispatch(const Call& call) const {
    if (call.kind == CallKind::ufunc && call.method != UfuncMethod::call) {
        throw UnsupportedBroadcastMode(fmt::format(
            "ufunc '{}' was called with method '{}'; only plain calls are supported",
            call.name, to_string(call.method)));
    }

    const auto types = capable_types(call);
    if (types.empty()) {
        if (config_.verbose) {
            fmt::print(stderr, "[aunc] dispatch {} '{}': no uncertain argument\n",
                       to_string(call.kind), call.name);
        }
        return std::nullopt;
    }
    if (types.size() > 1) {
        throw UnsupportedOperation(fmt::format(
            "{} '{}' mixes {} different uncertainty types", to_string(call.kind), call.name,
            types.size()));
    }

    const Rule* rule = registry_.find(call.kind, call.name);
    if (rule == nullptr) {
        if (config_.verbose) {
            fmt::print(stderr, "[aunc] dispatch {} '{}': not implemented\n",
                       to_string(call.kind), call.name);
        }
        return std::nullopt;
    }

    if (!rule->arity.accepts(call.args.size())) {
        throw TypeMismatch(fmt::format("{} '{}' does not accept {} positional arguments",
                                       to_string(call.kind), call.name, call.args.size()));
    }
    for (const auto& [key, value] : call.params) {
        if (!rule->accepts_keyword(key)) {
            throw TypeMismatch(fmt::format("{} '{}' got an unexpected keyword argument '{}'",
                                           to_string(call.kind), call.name, key));
        }
    }

    if (config_.verbose) {
        fmt::print(stderr, "[aunc] dispatch {} '{}': {} rule, {} argument(s)\n",
                   to_string(call.kind), call.name,
                   rule->is_closed_form() ? "closed-form" : "pass-through", call.args.size());
    }
    return apply(*rule, call);
}

Uncertainty Dispatcher::apply(const Rule& rule, const Call& call) const {
    const RuleContext ctx{call.params, config_.downcast};

    if (const auto* closed = std::get_if<ClosedFormRule>(&rule.apply)) {
        std::vector<propagation::Operand> operands;
        operands.reserve(call.args.size());
        for (const Argument& arg : call.args) {
            if (const auto* u = std::get_if<Uncertainty>(&arg)) {
                operands.emplace_back(propagation::UncertaintyOperand{u->value(), u->error()});
            } else {
                operands.emplace_back(propagation::ScalarOperand{std::get<NDArray>(arg)});
            }
        }
        auto c = (*closed)(operands, ctx);
        return Uncertainty(std::move(c.nominal), std::move(c.error));
    }

    const auto& pass = std::get<PassThroughRule>(rule.apply);
    std::vector<NDArray> nominals;
    std::vector<NDArray> errors;
    nominals.reserve(call.args.size());
    errors.reserve(call.args.size());
    for (const Argument& arg : call.args) {
        std::visit([&](const auto& value) {
            nominals.push_back(nominal_values(value));
            errors.push_back(std_devs(value));
        }, arg);
    }
    NDArray nominal = pass(nominals, ctx);
    NDArray error   = pass(errors, ctx);
    return Uncertainty(std::move(nominal), std::move(error));
}

Uncertainty Dispatcher::invoke(const Call& call) const {
    if (auto result = dispatch(call)) {
        return std::move(*result);
    }
    throw UnsupportedOperation(fmt::format("no propagation rule for {} '{}'",
                                           to_string(call.kind), call.name));
}

Uncertainty Dispatcher::ufunc(std::string_view name, std::vector<Argument> args,
                              UfuncMethod method) const {
    return invoke(Call{CallKind::ufunc, std::string(name), method, std::move(args), {}});
}

Uncertainty Dispatcher::function(std::string_view name, std::vector<Argument> args,
                                 Params params) const {
    return invoke(Call{CallKind::function, std::string(name), UfuncMethod::call, std::move(args),
                       std::move(params)});
}

} // namespace aunc
