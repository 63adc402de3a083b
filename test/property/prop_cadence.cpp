/**
 * @file  prop_cadence.cpp
 * @brief Property: run cadence below 100 spm is doubled, everything else passes through
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_cadence
 *
 * Basis:
 *   Running devices report one foot's strides per minute.  A run cadence
 *   under the doubling threshold is therefore half the step cadence, while
 *   cycling and walking cadences are already in their native unit.
 */

#include <rapidcheck.h>

#include "tsig/cadence.hpp"

using namespace tsig;
using namespace tsig::units;

int main() {
    // ── Property 1: run cadence under the threshold doubles ──────────────────
    rc::check(
        "cadence: run values in (0, 100) are doubled",
        []() {
            const double c = *rc::gen::inRange(1, 1000) / 10.0;
            const auto out = CadenceNormalizer::normalize(c, SportType::Run);
            RC_ASSERT(out.has_value());
            RC_ASSERT(*out == 2.0 * c);
        }
    );

    // ── Property 2: values at or above the threshold are unchanged ───────────
    rc::check(
        "cadence: run values >= 100 are unchanged",
        []() {
            const double c = 100.0 + *rc::gen::inRange(0, 2000) / 10.0;
            RC_ASSERT(*CadenceNormalizer::normalize(c, SportType::Run) == c);
        }
    );

    // ── Property 3: other sports are never doubled ───────────────────────────
    rc::check(
        "cadence: ride and walk values are unchanged",
        []() {
            const double c = *rc::gen::inRange(1, 3000) / 10.0;
            RC_ASSERT(*CadenceNormalizer::normalize(c, SportType::Ride) == c);
            RC_ASSERT(*CadenceNormalizer::normalize(c, SportType::Walk) == c);
        }
    );

    // ── Property 4: normalization is idempotent above the threshold ──────────
    rc::check(
        "cadence: normalizing twice doubles at most once for values >= 50",
        []() {
            const double c     = *rc::gen::inRange(500, 1000) / 10.0;
            const auto   once  = CadenceNormalizer::normalize(c, SportType::Run);
            const auto   twice = CadenceNormalizer::normalize(once, SportType::Run);
            RC_ASSERT(once == twice);
        }
    );

    return 0;
}
