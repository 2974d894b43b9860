#pragma once

#include "data/delimited_reader.hpp"
#include "data/time_series.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "time_utils.hpp"

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// TimeSeriesLoader — reads <root>/<asset>.txt (comma-separated, header row).
// Every column except X and T is a binary attribute. T must parse as a date
// and never decrease from one row to the next.
// ---------------------------------------------------------------------------
class TimeSeriesLoader {
public:
    explicit TimeSeriesLoader(std::string root) : root_(std::move(root)) {}

    std::string data_path(const std::string& asset) const {
        return (std::filesystem::path(root_) / (asset + ".txt")).string();
    }

    TimeSeries load(const std::string& asset) const {
        return load_file(data_path(asset), asset);
    }

    static TimeSeries load_file(const std::string& path, const std::string& asset) {
        if (!std::filesystem::exists(path)) {
            throw MissingInputError(path);
        }
        std::vector<int> ragged;
        auto table = delimited::read_table(path, ',', &ragged);
        if (!table) {
            throw MissingInputError(path);
        }
        if (!ragged.empty()) {
            throw std::runtime_error("Ragged row at line " + std::to_string(ragged.front()) +
                                     " in " + path);
        }

        int x_col = table->column("X");
        int t_col = table->column("T");
        if (x_col < 0 || t_col < 0) {
            throw std::runtime_error("Time-series file needs X and T columns: " + path);
        }

        TimeSeries series(asset);
        std::vector<int> attr_cols;
        for (size_t c = 0; c < table->header.size(); ++c) {
            int ci = static_cast<int>(c);
            if (ci == x_col || ci == t_col) continue;
            series.add_attribute(table->header[c]);
            attr_cols.push_back(ci);
        }
        series.reserve(table->rows.size());

        std::vector<uint8_t> values(attr_cols.size());
        int prev_date = time_utils::INVALID_DATE;
        for (size_t r = 0; r < table->rows.size(); ++r) {
            const auto& row = table->rows[r];
            const auto& ts = row[static_cast<size_t>(t_col)];
            int date = time_utils::parse_date(ts);
            if (date == time_utils::INVALID_DATE) {
                throw std::runtime_error("Unparsable T '" + ts + "' at data row " +
                                         std::to_string(r) + " in " + path);
            }
            // Date windows binary-search the date column.
            if (date < prev_date) {
                throw std::runtime_error("T goes backwards ('" + ts + "') at data row " +
                                         std::to_string(r) + " in " + path);
            }
            prev_date = date;
            auto x = delimited::parse_double(row[static_cast<size_t>(x_col)]);
            if (!x) {
                throw std::runtime_error("Non-numeric X '" + row[static_cast<size_t>(x_col)] +
                                         "' at data row " + std::to_string(r) + " in " + path);
            }
            for (size_t a = 0; a < attr_cols.size(); ++a) {
                auto v = delimited::parse_double(row[static_cast<size_t>(attr_cols[a])]);
                values[a] = (v && *v == 1.0) ? 1 : 0;
            }
            series.append(ts, values, *x);
        }

        if (!series.empty()) {
            logging::logger()->info("{}: {} rows [{} .. {}], X range {:.3f} to {:.3f}",
                                    asset, series.size(), series.timestamp(0),
                                    series.timestamp(series.size() - 1),
                                    series.min_x(), series.max_x());
        } else {
            logging::logger()->warn("{}: time-series file has no rows: {}", asset, path);
        }
        return series;
    }

private:
    std::string root_;
};
