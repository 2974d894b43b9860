#pragma once

#include "rules/rule.hpp"

#include <string>

// ---------------------------------------------------------------------------
// TradeRecord — one-period holding: enter at row t, exit at row t + 1.
// Profits are in percentage points.
// ---------------------------------------------------------------------------
struct TradeRecord {
    int entry_idx = 0;
    int exit_idx = 0;
    std::string entry_timestamp;
    int entry_date = 0;          // YYYYMMDD
    Side side = Side::BUY;
    int rule_id = 0;
    std::string rule_text;
    int support_count = 0;
    double expected_x = 0.0;     // rule's mined mean, diagnostic only
    double actual_x = 0.0;       // X at exit_idx
    double gross_profit = 0.0;   // +actual_x for BUY, -actual_x for SELL
    double transaction_cost = 0.0;
    double net_profit = 0.0;
    double cumulative_return = 0.0;
    bool win = false;            // net_profit > 0
};
