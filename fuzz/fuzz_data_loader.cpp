/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for the summary and history CSV parsers
 *
 * Build:
 *   cmake -DTSIG_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. A parsed summary has a finite moving time.
 *   3. Every parsed history entry has finite distance and moving time.
 *   4. Aggregating any parsed history never yields a negative total.
 */

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "tsig/baseline.hpp"
#include "tsig/data_loader.hpp"

using namespace tsig;
using namespace tsig::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input{reinterpret_cast<const char*>(data), size};

    if (const auto summary = DataLoader::parse_summary_csv(input)) {
        if (!std::isfinite(summary->moving_time_s)) std::abort();
    }

    const auto history = DataLoader::parse_history_csv(input);
    for (const auto& e : history) {
        if (!std::isfinite(e.distance_m) || !std::isfinite(e.moving_time_s)) std::abort();
    }

    const auto b = baseline::BaselineAggregator::aggregate(history, 2.0e9);
    if (b.distance_28d_m && *b.distance_28d_m < 0.0) std::abort();
    if (b.moving_time_28d_s && *b.moving_time_28d_s < 0.0) std::abort();

    return 0;
}
