// portfolio_backtest.cpp — multi-asset portfolio of independent rule backtests
// Runs the single-asset backtest for every --assets entry, blends the equity
// curves under the chosen allocation strategy and reports portfolio metrics,
// cross-asset correlation and a quality grade.

#include "backtest/backtest_result_io.hpp"
#include "config/cli_args.hpp"
#include "config/simulation_config.hpp"
#include "engine/asset_backtest.hpp"
#include "io/parquet_writer.hpp"
#include "logging.hpp"
#include "portfolio/portfolio_aggregator.hpp"
#include "portfolio/portfolio_io.hpp"

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --assets A B ... [options]\n"
              << "\n"
              << "  --assets A B ...    Assets to combine (required)\n"
              << cli::common_usage();
}

void print_report(const PortfolioResult& r) {
    std::printf("\n================================================================\n");
    std::printf("Portfolio (%s)\n", allocation_strategy_str(r.strategy));
    std::printf("================================================================\n");
    std::printf("%-10s %8s %11s %9s %7s %11s %9s\n",
                "Asset", "Weight", "Return", "WinRate", "Trades", "MaxDD", "Sharpe");
    for (size_t i = 0; i < r.assets.size(); ++i) {
        const auto& m = r.assets[i];
        std::printf("%-10s %7.2f%% %+10.3f%% %8.2f%% %7d %+10.3f%% %9.4f\n",
                    m.asset.c_str(), r.weights[i] * 100.0, m.total_return, m.win_rate * 100.0,
                    m.total_trades, m.max_drawdown, m.sharpe);
    }
    for (const auto& ex : r.excluded) {
        std::printf("%-10s excluded: %s\n", ex.asset.c_str(), ex.reason.c_str());
    }

    std::printf("\nTotal Return:         %+.3f%%\n", r.metrics.total_return);
    std::printf("Max Drawdown:         %+.3f%%\n", r.metrics.max_drawdown);
    std::printf("Sharpe:               %.4f\n", r.metrics.sharpe);
    std::printf("Volatility:           %.4f%%\n", r.metrics.volatility);
    std::printf("Timestamps:           %d\n", r.metrics.n_timestamps);
    std::printf("Avg Correlation:      %.4f\n", r.avg_correlation);
    std::printf("Diversification:      %+.3f%% vs. mean single asset\n",
                r.diversification_benefit);
    std::printf("Grade:                %s\n", portfolio_grade_str(r.grade));

    std::printf("\nCorrelation\n%-10s", "");
    for (const auto& a : r.correlation.assets) std::printf(" %9s", a.c_str());
    std::printf("\n");
    for (size_t i = 0; i < r.correlation.size(); ++i) {
        std::printf("%-10s", r.correlation.assets[i].c_str());
        for (size_t j = 0; j < r.correlation.size(); ++j) {
            std::printf(" %9.4f", r.correlation.at(i, j));
        }
        std::printf("\n");
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    SimulationConfig cfg{};
    std::vector<std::string> assets;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (cli::parse_common_option(i, argc, argv, cfg)) continue;
            if (arg == "--assets") {
                while (i + 1 < argc && argv[i + 1][0] != '-') assets.push_back(argv[++i]);
            } else if (arg == "--verbose") {
                logging::logger()->set_level(spdlog::level::debug);
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
        cfg.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }
    if (assets.empty()) {
        std::cerr << "Missing required argument: --assets\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        std::vector<AssetTrades> inputs;
        std::vector<ExcludedAsset> excluded;
        for (const auto& asset : assets) {
            auto run = run_asset_backtest(asset, cfg);
            if (run.skipped) {
                excluded.push_back({asset, run.skip_reason});
                continue;
            }
            inputs.push_back({asset, std::move(run.result.trades)});
        }

        PortfolioAggregator aggregator(cfg.allocation_strategy);
        auto result = aggregator.aggregate(inputs, excluded);

        auto dir = std::filesystem::path(cfg.output_dir) / "portfolio";
        backtest_io::write_file((dir / "portfolio_summary.json").string(),
                                portfolio_io::to_json(result));
        if (!result.defined) {
            std::cerr << "ERROR: no asset produced trades\n";
            for (const auto& ex : result.excluded) {
                std::cerr << "  " << ex.asset << ": " << ex.reason << "\n";
            }
            return 1;
        }

        print_report(result);
        backtest_io::write_file((dir / "portfolio_equity.csv").string(),
                                portfolio_io::equity_curve_csv(result.equity_curve));
        parquet_io::write_equity_curve(result.equity_curve,
                                       (dir / "portfolio_equity.parquet").string());
        backtest_io::write_file((dir / "asset_metrics.csv").string(),
                                portfolio_io::asset_metrics_csv(result));
        backtest_io::write_file((dir / "correlation_matrix.csv").string(),
                                portfolio_io::correlation_csv(result.correlation));
        std::printf("\nResults saved to: %s\n", dir.string().c_str());
    } catch (const std::runtime_error& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
