#pragma once

#include "time_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// IndexWindow — half-open row range [begin, end)
// ---------------------------------------------------------------------------
struct IndexWindow {
    int begin = 0;
    int end = 0;

    int size() const { return end > begin ? end - begin : 0; }
    bool empty() const { return end <= begin; }
};

// ---------------------------------------------------------------------------
// TimeSeriesRow — materialized view of one row
// ---------------------------------------------------------------------------
struct TimeSeriesRow {
    std::string timestamp;
    int date = time_utils::INVALID_DATE;
    std::map<std::string, int> attributes;
    double x = 0.0;  // realized % change; outcome for a signal at the previous row
};

// ---------------------------------------------------------------------------
// TimeSeries — one asset's chronologically ordered rows, stored by column
// ---------------------------------------------------------------------------
class TimeSeries {
public:
    TimeSeries() = default;
    explicit TimeSeries(std::string asset) : asset_(std::move(asset)) {}

    const std::string& asset() const { return asset_; }
    int size() const { return static_cast<int>(x_.size()); }
    bool empty() const { return x_.empty(); }

    // Declare an attribute column. Must be called before rows are appended.
    void add_attribute(const std::string& name) {
        if (attributes_.count(name)) return;
        attribute_names_.push_back(name);
        attributes_[name].reserve(x_.capacity());
    }

    // Append a row; `values` follows the order of attribute_names().
    void append(const std::string& timestamp, const std::vector<uint8_t>& values, double x) {
        timestamps_.push_back(timestamp);
        dates_.push_back(time_utils::parse_date(timestamp));
        x_.push_back(x);
        for (size_t i = 0; i < attribute_names_.size(); ++i) {
            uint8_t v = i < values.size() ? values[i] : 0;
            attributes_[attribute_names_[i]].push_back(v);
        }
    }

    void reserve(size_t n) {
        timestamps_.reserve(n);
        dates_.reserve(n);
        x_.reserve(n);
        for (auto& kv : attributes_) kv.second.reserve(n);
    }

    const std::vector<std::string>& attribute_names() const { return attribute_names_; }

    // Column for `name`, or nullptr when the series has no such attribute.
    const std::vector<uint8_t>* attribute(const std::string& name) const {
        auto it = attributes_.find(name);
        return it == attributes_.end() ? nullptr : &it->second;
    }

    bool is_active(const std::string& name, int idx) const {
        if (idx < 0 || idx >= size()) return false;
        const auto* col = attribute(name);
        return col != nullptr && (*col)[static_cast<size_t>(idx)] == 1;
    }

    double x(int idx) const { return x_[static_cast<size_t>(idx)]; }
    const std::string& timestamp(int idx) const { return timestamps_[static_cast<size_t>(idx)]; }
    int date(int idx) const { return dates_[static_cast<size_t>(idx)]; }

    TimeSeriesRow row(int idx) const {
        TimeSeriesRow r{};
        r.timestamp = timestamp(idx);
        r.date = date(idx);
        r.x = x(idx);
        for (const auto& name : attribute_names_) {
            r.attributes[name] = attributes_.at(name)[static_cast<size_t>(idx)];
        }
        return r;
    }

    // Rows whose date lies in [from_date, to_date] (inclusive YYYYMMDD).
    // Rows are assumed chronological.
    IndexWindow index_range(int from_date, int to_date) const {
        auto lo = std::lower_bound(dates_.begin(), dates_.end(), from_date);
        auto hi = std::upper_bound(dates_.begin(), dates_.end(), to_date);
        IndexWindow w{};
        w.begin = static_cast<int>(lo - dates_.begin());
        w.end = std::max(w.begin, static_cast<int>(hi - dates_.begin()));
        return w;
    }

    // Rows dated on or after `from_date`, through the end of the series.
    IndexWindow index_from(int from_date) const {
        auto lo = std::lower_bound(dates_.begin(), dates_.end(), from_date);
        return IndexWindow{static_cast<int>(lo - dates_.begin()), size()};
    }

    double min_x() const { return x_.empty() ? 0.0 : *std::min_element(x_.begin(), x_.end()); }
    double max_x() const { return x_.empty() ? 0.0 : *std::max_element(x_.begin(), x_.end()); }

private:
    std::string asset_;
    std::vector<std::string> attribute_names_;
    std::unordered_map<std::string, std::vector<uint8_t>> attributes_;
    std::vector<std::string> timestamps_;
    std::vector<int> dates_;
    std::vector<double> x_;
};
