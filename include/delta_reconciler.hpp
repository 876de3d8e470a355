#pragma once

#include <cstdint>

namespace fritz {

// Last raw sample seen for one counter metric. Starts at 0, so the first
// reconciled increment is the full raw value.
struct ReconciliationState {
    std::uint64_t last_raw_value = 0;
};

/**
 * Converts a cumulative device counter sample into a non-negative increment.
 *
 * Normal progress yields new_raw - last. A sample below the previous one means the
 * device counter wrapped (or was reset) at an unknown width; the increment is then
 * estimated as new_raw * 2, the mean expected increase over a uniformly distributed
 * wrap point. The state always advances to new_raw.
 */
std::uint64_t reconcile(ReconciliationState& state, std::uint64_t new_raw);

// True if reconcile() would take the wrap branch for this sample.
inline bool is_wrap(const ReconciliationState& state, std::uint64_t new_raw) {
    return new_raw < state.last_raw_value;
}

}
