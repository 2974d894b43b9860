#pragma once

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// CorrelationMatrix — Pearson correlation between assets' aligned profit series
// ---------------------------------------------------------------------------
struct CorrelationMatrix {
    std::vector<std::string> assets;
    std::vector<std::vector<double>> values;

    size_t size() const { return assets.size(); }
    double at(size_t i, size_t j) const { return values[i][j]; }

    // Mean of the strict upper triangle; 0 for fewer than two assets.
    double average_pairwise() const {
        double sum = 0.0;
        int count = 0;
        for (size_t i = 0; i < values.size(); ++i) {
            for (size_t j = i + 1; j < values.size(); ++j) {
                sum += values[i][j];
                ++count;
            }
        }
        return count > 0 ? sum / count : 0.0;
    }
};

namespace portfolio_util {

// Pearson correlation; 0 when either series has zero variance.
inline double pearson(const std::vector<double>& x, const std::vector<double>& y) {
    size_t n = std::min(x.size(), y.size());
    if (n < 2) return 0.0;
    double mx = 0.0, my = 0.0;
    for (size_t i = 0; i < n; ++i) {
        mx += x[i];
        my += y[i];
    }
    mx /= static_cast<double>(n);
    my /= static_cast<double>(n);

    double sxy = 0.0, sxx = 0.0, syy = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double dx = x[i] - mx;
        double dy = y[i] - my;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    if (!(sxx > 0.0) || !(syy > 0.0)) return 0.0;
    return sxy / std::sqrt(sxx * syy);
}

inline CorrelationMatrix correlation_matrix(const std::vector<std::string>& assets,
                                            const std::vector<std::vector<double>>& series) {
    CorrelationMatrix cm{};
    cm.assets = assets;
    size_t n = assets.size();
    cm.values.assign(n, std::vector<double>(n, 0.0));
    for (size_t i = 0; i < n; ++i) {
        cm.values[i][i] = 1.0;
        for (size_t j = i + 1; j < n; ++j) {
            double r = pearson(series[i], series[j]);
            cm.values[i][j] = r;
            cm.values[j][i] = r;
        }
    }
    return cm;
}

}  // namespace portfolio_util
