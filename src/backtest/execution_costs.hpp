#pragma once

#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// ExecutionCosts — symmetric round-trip cost approximation.
// Components are fractions of notional (0.0002 = 0.02%). Trade outcomes are
// in percentage points, so the applied cost is scaled by 100.
// ---------------------------------------------------------------------------
struct ExecutionCosts {
    double spread = 0.0002;
    double commission = 0.0001;
    double slippage = 0.0001;

    // Sum of the three components as a fraction.
    double round_trip_cost() const {
        return spread + commission + slippage;
    }

    // Cost charged per trade, in the same percentage units as X.
    double round_trip_cost_pct() const {
        return round_trip_cost() * 100.0;
    }

    void validate() const {
        if (spread < 0.0 || commission < 0.0 || slippage < 0.0) {
            throw std::invalid_argument(
                "Execution costs must be non-negative (spread=" + std::to_string(spread) +
                ", commission=" + std::to_string(commission) +
                ", slippage=" + std::to_string(slippage) + ")");
        }
    }
};
