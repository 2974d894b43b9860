#pragma once

#include "config/simulation_config.hpp"
#include "portfolio/allocation.hpp"
#include "rules/rule_store.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Hand-rolled `--flag value` parsing shared by the tools
// ---------------------------------------------------------------------------
namespace cli {

inline int parse_int(const std::string& flag, const std::string& value) {
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || errno != 0 || end != value.c_str() + value.size()) {
        throw std::invalid_argument("Invalid integer for " + flag + ": '" + value + "'");
    }
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw std::invalid_argument("Integer out of range for " + flag + ": '" + value + "'");
    }
    return static_cast<int>(v);
}

inline double parse_double(const std::string& flag, const std::string& value) {
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(value.c_str(), &end);
    if (value.empty() || errno != 0 || end != value.c_str() + value.size()) {
        throw std::invalid_argument("Invalid number for " + flag + ": '" + value + "'");
    }
    return v;
}

// Consume one option shared by every tool. Returns false when argv[i] is not
// one of them; on success `i` points at the last consumed argument.
inline bool parse_common_option(int& i, int argc, char* argv[], SimulationConfig& cfg) {
    std::string arg = argv[i];

    if (arg == "--no-dedup") {
        cfg.deduplicate = false;
        return true;
    }

    static const char* const VALUE_FLAGS[] = {
        "--top", "--sort-by", "--test-start", "--train-years", "--test-years",
        "--start-year", "--end-year", "--spread", "--commission", "--slippage",
        "--strategy", "--rules-root", "--data-root", "--output-dir",
    };
    bool known = false;
    for (const char* f : VALUE_FLAGS) {
        if (arg == f) known = true;
    }
    if (!known) return false;
    if (i + 1 >= argc) {
        throw std::invalid_argument("Missing value for " + arg);
    }
    std::string value = argv[++i];

    if (arg == "--top")              cfg.top_n_rules = parse_int(arg, value);
    else if (arg == "--sort-by")     cfg.sort_by = parse_sort_key(value);
    else if (arg == "--test-start")  cfg.test_start_date = value;
    else if (arg == "--train-years") cfg.train_years = parse_int(arg, value);
    else if (arg == "--test-years")  cfg.test_years = parse_int(arg, value);
    else if (arg == "--start-year")  cfg.start_year = parse_int(arg, value);
    else if (arg == "--end-year")    cfg.end_year = parse_int(arg, value);
    else if (arg == "--spread")      cfg.spread = parse_double(arg, value);
    else if (arg == "--commission")  cfg.commission = parse_double(arg, value);
    else if (arg == "--slippage")    cfg.slippage = parse_double(arg, value);
    else if (arg == "--strategy")    cfg.allocation_strategy = parse_allocation_strategy(value);
    else if (arg == "--rules-root")  cfg.rules_root = value;
    else if (arg == "--data-root")   cfg.data_root = value;
    else if (arg == "--output-dir")  cfg.output_dir = value;
    return true;
}

inline const char* common_usage() {
    return "  --top N             Rules per direction (default 20, 0 = all)\n"
           "  --sort-by KEY       support | extreme_score | snr | extremeness | discovery\n"
           "  --test-start DATE   First test date, YYYY-MM-DD (default 2021-01-01)\n"
           "  --train-years N     Walk-forward train window (default 5)\n"
           "  --test-years N      Walk-forward test window and step (default 1)\n"
           "  --start-year Y      Walk-forward first year (default 2010)\n"
           "  --end-year Y        Walk-forward last year (default 2025)\n"
           "  --spread F          Spread as a fraction (default 0.0002)\n"
           "  --commission F      Commission as a fraction (default 0.0001)\n"
           "  --slippage F        Slippage as a fraction (default 0.0001)\n"
           "  --no-dedup          Keep every signal per timestamp\n"
           "  --strategy S        equal_weight | risk_parity | performance_based\n"
           "  --rules-root DIR    Rule tables root (default output)\n"
           "  --data-root DIR     Time-series root (default forex_data/gnminer_individual)\n"
           "  --output-dir DIR    Result directory (default results)\n"
           "  --verbose           Debug logging\n";
}

}  // namespace cli
