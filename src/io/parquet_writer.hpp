#pragma once

#include "backtest/trade_record.hpp"
#include "portfolio/portfolio_aggregator.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Parquet export (ZSTD) of trade lists and equity curves. Every Arrow status
// is checked; failures throw std::runtime_error.
// ---------------------------------------------------------------------------
namespace parquet_io {

inline void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error(what + ": " + status.ToString());
    }
}

inline std::shared_ptr<arrow::Array> finish(arrow::ArrayBuilder& b, const std::string& column) {
    std::shared_ptr<arrow::Array> arr;
    check(b.Finish(&arr), "Failed to build column " + column);
    return arr;
}

inline void write_table(const std::shared_ptr<arrow::Table>& table, const std::string& path) {
    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet output file: " + path + ": " +
                                 outfile_result.status().ToString());
    }
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    int64_t chunk = std::max<int64_t>(1, table->num_rows());
    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile,
                                     chunk, props),
          "Failed to write Parquet " + path);
    check(outfile->Close(), "Failed to close " + path);
}

inline void write_trades(const std::vector<TradeRecord>& trades, const std::string& path) {
    auto schema = arrow::schema({
        arrow::field("entry_t", arrow::int64()),
        arrow::field("exit_t", arrow::int64()),
        arrow::field("entry_date", arrow::utf8()),
        arrow::field("signal", arrow::utf8()),
        arrow::field("rule_id", arrow::int64()),
        arrow::field("rule_text", arrow::utf8()),
        arrow::field("actual_x", arrow::float64()),
        arrow::field("profit_before_cost", arrow::float64()),
        arrow::field("transaction_cost", arrow::float64()),
        arrow::field("profit", arrow::float64()),
        arrow::field("win", arrow::boolean()),
        arrow::field("cumulative_return", arrow::float64()),
    });

    arrow::Int64Builder entry_b, exit_b, rule_b;
    arrow::StringBuilder date_b, signal_b, text_b;
    arrow::DoubleBuilder actual_b, gross_b, cost_b, net_b, cum_b;
    arrow::BooleanBuilder win_b;

    for (const auto& t : trades) {
        check(entry_b.Append(t.entry_idx), "entry_t");
        check(exit_b.Append(t.exit_idx), "exit_t");
        check(date_b.Append(t.entry_timestamp), "entry_date");
        check(signal_b.Append(std::string(side_str(t.side))), "signal");
        check(rule_b.Append(t.rule_id), "rule_id");
        check(text_b.Append(t.rule_text), "rule_text");
        check(actual_b.Append(t.actual_x), "actual_x");
        check(gross_b.Append(t.gross_profit), "profit_before_cost");
        check(cost_b.Append(t.transaction_cost), "transaction_cost");
        check(net_b.Append(t.net_profit), "profit");
        check(win_b.Append(t.win), "win");
        check(cum_b.Append(t.cumulative_return), "cumulative_return");
    }

    std::vector<std::shared_ptr<arrow::Array>> arrays = {
        finish(entry_b, "entry_t"),  finish(exit_b, "exit_t"),
        finish(date_b, "entry_date"), finish(signal_b, "signal"),
        finish(rule_b, "rule_id"),   finish(text_b, "rule_text"),
        finish(actual_b, "actual_x"), finish(gross_b, "profit_before_cost"),
        finish(cost_b, "transaction_cost"), finish(net_b, "profit"),
        finish(win_b, "win"),        finish(cum_b, "cumulative_return"),
    };
    write_table(arrow::Table::Make(schema, arrays), path);
}

inline void write_equity_curve(const std::vector<EquityPoint>& curve, const std::string& path) {
    auto schema = arrow::schema({
        arrow::field("timestamp", arrow::utf8()),
        arrow::field("equity", arrow::float64()),
    });

    arrow::StringBuilder ts_b;
    arrow::DoubleBuilder eq_b;
    for (const auto& p : curve) {
        check(ts_b.Append(p.timestamp), "timestamp");
        check(eq_b.Append(p.equity), "equity");
    }
    std::vector<std::shared_ptr<arrow::Array>> arrays = {
        finish(ts_b, "timestamp"), finish(eq_b, "equity"),
    };
    write_table(arrow::Table::Make(schema, arrays), path);
}

}  // namespace parquet_io
