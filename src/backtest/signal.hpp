#pragma once

#include "rules/rule.hpp"

#include <string>

// ---------------------------------------------------------------------------
// Signal — a rule whose conditions all hold at row `t`
// ---------------------------------------------------------------------------
struct Signal {
    int t = 0;
    std::string timestamp;
    Side side = Side::BUY;
    Direction direction = Direction::POSITIVE;
    int rule_id = 0;
    std::string rule_text;
    int support_count = 0;
    double expected_x = 0.0;
};
