/**
 * @file  fuzz_dispatch.cpp
 * @brief libFuzzer target for the Dispatcher over the default registry
 *
 * Build:
 *   cmake -DAUNC_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_dispatch
 *
 * Input layout:
 *   byte 0      call kind (even: ufunc, odd: function)
 *   byte 1      operation index into the registered names
 *   byte 2      ufunc method
 *   byte 3      argument count (1..4)
 *   byte 4      downcast policy
 *   rest        doubles: nominal/error pairs, one per argument; an odd
 *               remainder byte turns the next argument into a plain value
 *
 * Safety invariants verified on every input:
 *   1. No crash; failures surface only as aunc::UncertaintyError.
 *   2. A non-call ufunc method always raises UnsupportedBroadcastMode.
 *   3. Every returned value has matching value and error shapes.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <string>
#include <vector>

#include "aunc/diagnostics.hpp"
#include "aunc/dispatch.hpp"
#include "aunc/errors.hpp"
#include "aunc/registry.hpp"

using namespace aunc;

namespace {

const OperationRegistry& registry() {
    static const OperationRegistry r = make_default_registry();
    return r;
}

constexpr UfuncMethod kMethods[] = {UfuncMethod::call, UfuncMethod::reduce,
                                    UfuncMethod::accumulate, UfuncMethod::reduceat,
                                    UfuncMethod::outer, UfuncMethod::at};

constexpr DowncastPolicy kPolicies[] = {DowncastPolicy::warn, DowncastPolicy::raise,
                                        DowncastPolicy::silent};

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 5) {
        return 0;
    }
    diagnostics::ScopedWarningCapture quiet;

    const CallKind kind = (data[0] % 2 == 0) ? CallKind::ufunc : CallKind::function;
    const auto names = registry().names(kind);
    const std::string& name = names[data[1] % names.size()];
    const UfuncMethod method = kMethods[data[2] % std::size(kMethods)];
    const std::size_t argc = 1 + data[3] % 4;

    DispatchConfig config;
    config.downcast = kPolicies[data[4] % std::size(kPolicies)];
    const Dispatcher dispatcher(registry(), config);

    Call call{kind, name, method, {}, {}};
    std::size_t offset = 5;
    for (std::size_t a = 0; a < argc; ++a) {
        double pair[2] = {1.0, 0.0};
        if (offset + sizeof(pair) <= size) {
            std::memcpy(pair, data + offset, sizeof(pair));
            offset += sizeof(pair);
        }
        const bool plain = offset < size && (data[offset] & 1) != 0;
        if (plain) {
            call.args.emplace_back(NDArray(pair[0]));
        } else {
            try {
                call.args.emplace_back(Uncertainty(pair[0], pair[1]));
            } catch (const NegativeErrorValue&) {
                call.args.emplace_back(Uncertainty(pair[0], std::fabs(pair[1])));
            }
        }
    }

    try {
        const auto result = dispatcher.dispatch(call);
        assert(kind == CallKind::function || method == UfuncMethod::call);
        if (result) {
            assert(result->value().shape() == result->error().shape());
        }
    } catch (const UnsupportedBroadcastMode&) {
        assert(kind == CallKind::ufunc && method != UfuncMethod::call);
    } catch (const UncertaintyError&) {
        // Arity, keyword, shape and downcast failures are expected.
    }
    return 0;
}
