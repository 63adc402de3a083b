/**
 * @file  fuzz_engine.cpp
 * @brief libFuzzer target for the full Engine pipeline (end-to-end)
 *
 * Build:
 *   cmake -DTSIG_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_engine
 *
 * Run for 60 seconds:
 *   ./fuzz_engine -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. A stream file that fails validation raises ValidationError and
 *      nothing else.
 *   3. If metrics are returned:
 *      a. effort_score is finite and >= 0
 *      b. risk score is >= 0 and its level agrees with the score
 *      c. every zone minute count is finite and >= 0
 *      d. splits are indexed 1..n in order
 *
 * Fuzzer strategy:
 *   Input is parsed as a stream CSV by DataLoader::parse_streams_csv().  The
 *   parser and the pipeline must handle:
 *     • Binary garbage (null bytes, high bytes)
 *     • "NaN", "inf", "-inf" text tokens
 *     • Decreasing and duplicated timestamps
 *     • Misaligned rows and missing channels
 *     • Implausible heart rates and negative distances
 */

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "tsig/data_loader.hpp"
#include "tsig/engine.hpp"
#include "tsig/risk.hpp"

using namespace tsig;
using namespace tsig::core;

namespace {

void check(bool ok) {
    if (!ok) {
        std::abort();
    }
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input{reinterpret_cast<const char*>(data), size};

    auto streams = DataLoader::parse_streams_csv(input);
    if (!streams) {
        return 0;
    }

    AnalysisRequest req;
    req.summary.type          = SportType::Run;
    req.summary.moving_time_s = 1800.0;
    req.summary.distance_m    = 5000.0;
    req.summary.avg_hr        = 150.0;
    req.streams               = std::move(*streams);

    DerivedMetrics m;
    try {
        m = Engine{}.analyze(req);
    } catch (const ValidationError&) {
        return 0;
    }

    // Invariant 3a
    check(std::isfinite(m.effort_score) && m.effort_score >= 0.0);

    // Invariant 3b
    check(m.risk.score >= 0);
    check(m.risk.level == risk::RiskScorer::level_of(m.risk.score));

    // Invariant 3c
    if (m.time_in_zones) {
        for (const double v : m.time_in_zones->minutes) {
            check(std::isfinite(v) && v >= 0.0);
        }
    }

    // Invariant 3d
    for (std::size_t i = 0; i < m.splits.size(); ++i) {
        check(m.splits[i].index == i + 1);
    }

    return 0;
}
