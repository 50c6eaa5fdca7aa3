/**
 * @file  fuzz_uncertainty.cpp
 * @brief libFuzzer target for Uncertainty construction and operators
 *
 * Build:
 *   cmake -DAUNC_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_uncertainty
 *
 * Run for 60 seconds:
 *   ./fuzz_uncertainty -max_total_time=60
 *
 * Input layout: the bytes are read as doubles, alternating nominal and
 * error; the first half of the pairs forms x, the rest y.
 *
 * Safety invariants verified on every input:
 *   1. Construction either succeeds or throws an aunc::UncertaintyError.
 *   2. value and error of every result have the same shape.
 *   3. No result error element is negative.
 *   4. Comparisons never throw for matching shapes.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include "aunc/errors.hpp"
#include "aunc/uncertainty.hpp"

using namespace aunc;

namespace {

void check_result(const Uncertainty& r) {
    assert(r.value().shape() == r.error().shape());
    for (Index i = 0; i < r.size(); ++i) {
        const double e = r.error().at(i);
        assert(std::isnan(e) || e >= 0.0);
    }
}

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::size_t count = size / sizeof(double);
    if (count < 4) {
        return 0;
    }
    std::vector<double> values(count);
    std::memcpy(values.data(), data, count * sizeof(double));

    const std::size_t pairs = count / 2;
    const std::size_t half  = pairs / 2;
    std::vector<double> xn, xe, yn, ye;
    for (std::size_t p = 0; p < half * 2; ++p) {
        auto& nominal = p < half ? xn : yn;
        auto& error   = p < half ? xe : ye;
        nominal.push_back(values[2 * p]);
        error.push_back(values[2 * p + 1]);
    }

    try {
        Uncertainty x(NDArray::from_vector(xn), NDArray::from_vector(xe));
        const Uncertainty y(NDArray::from_vector(yn), NDArray::from_vector(ye));

        check_result(x + y);
        check_result(x - y);
        check_result(x * y);
        check_result(x / y);
        check_result(-x);
        check_result(abs(y));
        check_result(x * values[0]);

        static_cast<void>(x < y);
        static_cast<void>(x == y);

        x += y;
        check_result(x);
    } catch (const UncertaintyError&) {
        // Rejected input (negative error, etc.)
    }
    return 0;
}
