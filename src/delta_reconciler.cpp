#include "delta_reconciler.hpp"
#include "logger.hpp"
#include <string>

namespace fritz {

std::uint64_t reconcile(ReconciliationState& state, std::uint64_t new_raw) {
    std::uint64_t increment;

    if (!is_wrap(state, new_raw)) {
        increment = new_raw - state.last_raw_value;
    } else {
        // Wraps modulo 2^64 for new_raw above 2^63
        increment = new_raw * 2;
        if (Logger::is_enabled(Logger::Level::DEBUG)) {
            Logger::log(Logger::Level::DEBUG, Logger::EventType::RECONCILE,
                        "Counter went from " + std::to_string(state.last_raw_value) + " to " +
                        std::to_string(new_raw) + ", assuming overflow and estimating increment " +
                        std::to_string(increment));
        }
    }

    state.last_raw_value = new_raw;
    return increment;
}

}
