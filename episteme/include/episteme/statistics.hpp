#pragma once
// Pooled noise statistics: variance pooling, chi-square CI, drift
//
// Replicate groups contribute df = n-1 and SSE = df * s^2. The pooled
// sigma is sqrt(SSE/df). Its 95% confidence interval uses the
// Wilson-Hilferty chi-square quantile, and the gate works on the
// width of that interval relative to sigma:
//
//   rel_width = |ci_high - ci_low| / sigma
//
// Drift compares the mean of the most recent k per-cycle sigmas with the
// k before them, normalized by the pooled sigma.

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <deque>
#include <optional>
#include <utility>
#include <vector>

namespace episteme {
namespace stats {

// Inverse standard normal CDF (Acklam's rational approximation,
// relative error below 1.2e-9 over (0,1))
inline std::optional<double> inv_norm_cdf(double p) {
    if (!(p > 0.0 && p < 1.0)) return std::nullopt;

    static const double a[] = {-3.969683028665376e+01, 2.209460984245205e+02,
                               -2.759285104469687e+02, 1.383577518672690e+02,
                               -3.066479806614716e+01, 2.506628277459239e+00};
    static const double b[] = {-5.447609879822406e+01, 1.615858368580409e+02,
                               -1.556989798598866e+02, 6.680131188771972e+01,
                               -1.328068155288572e+01};
    static const double c[] = {-7.784894002430293e-03, -3.223964580411365e-01,
                               -2.400758277161838e+00, -2.549732539343734e+00,
                               4.374664141464968e+00, 2.938163982698783e+00};
    static const double d[] = {7.784695709041462e-03, 3.224671290700398e-01,
                               2.445134137142996e+00, 3.754408661907416e+00};

    constexpr double p_low = 0.02425;
    constexpr double p_high = 1.0 - p_low;

    if (p < p_low) {
        double q = std::sqrt(-2.0 * std::log(p));
        return (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
               ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
    }
    if (p > p_high) {
        double q = std::sqrt(-2.0 * std::log(1.0 - p));
        return -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
                ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
    }
    double q = p - 0.5;
    double r = q * q;
    return (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
           (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
}

// Wilson-Hilferty chi-square quantile
inline std::optional<double> chi2_quantile(double p, double df) {
    if (df <= 0.0) return std::nullopt;
    auto z = inv_norm_cdf(p);
    if (!z) return std::nullopt;
    double k = 2.0 / (9.0 * df);
    double base = 1.0 - k + (*z) * std::sqrt(k);
    double val = df * base * base * base;
    return std::max(val, 1e-3);
}

struct SigmaInterval {
    double low;
    double high;
};

// Confidence interval for sigma from pooled SSE and df
inline std::optional<SigmaInterval> sigma_interval(double sse, double df, double alpha = 0.05) {
    if (df <= 0.0 || sse <= 0.0) return std::nullopt;
    auto chi_lo = chi2_quantile(alpha / 2.0, df);
    auto chi_hi = chi2_quantile(1.0 - alpha / 2.0, df);
    if (!chi_lo || !chi_hi) return std::nullopt;
    return SigmaInterval{std::sqrt(sse / *chi_hi), std::sqrt(sse / *chi_lo)};
}

// Pooled variance accumulator
class PooledVariance {
public:
    // Adds one replicate group. Groups with fewer than two wells carry no df.
    bool add_group(size_t n, double stddev) {
        if (n < 2 || !std::isfinite(stddev) || stddev < 0.0) return false;
        double df = static_cast<double>(n - 1);
        df_ += df;
        sse_ += df * stddev * stddev;
        return true;
    }

    double df() const { return df_; }
    double sse() const { return sse_; }

    std::optional<double> sigma() const {
        if (df_ <= 0.0 || sse_ <= 0.0) return std::nullopt;
        return std::sqrt(sse_ / df_);
    }

    std::optional<SigmaInterval> interval(double alpha = 0.05) const {
        return sigma_interval(sse_, df_, alpha);
    }

    std::optional<double> relative_width(double alpha = 0.05) const {
        auto s = sigma();
        auto ci = interval(alpha);
        if (!s || !ci || *s <= 0.0) return std::nullopt;
        return std::fabs(ci->high - ci->low) / *s;
    }

    void restore(double df, double sse) {
        df_ = df;
        sse_ = sse;
    }

private:
    double df_ = 0.0;
    double sse_ = 0.0;
};

// Rolling per-cycle sigma history with a window/half-window drift test
class DriftTracker {
public:
    explicit DriftTracker(size_t window = 20, size_t k = 5)
        : window_(window), k_(k) {}

    void push(double sigma_cycle) {
        history_.push_back(sigma_cycle);
        while (history_.size() > window_) history_.pop_front();
    }

    // Unknown until 2k samples exist
    std::optional<double> metric(std::optional<double> pooled_sigma) const {
        if (history_.size() < 2 * k_ || !pooled_sigma || *pooled_sigma <= 0.0) {
            return std::nullopt;
        }
        size_t n = history_.size();
        double prev = 0.0, recent = 0.0;
        for (size_t i = n - 2 * k_; i < n - k_; ++i) prev += history_[i];
        for (size_t i = n - k_; i < n; ++i) recent += history_[i];
        prev /= static_cast<double>(k_);
        recent /= static_cast<double>(k_);
        return std::fabs(recent - prev) / *pooled_sigma;
    }

    size_t size() const { return history_.size(); }
    std::vector<double> history() const { return {history_.begin(), history_.end()}; }

private:
    size_t window_;
    size_t k_;
    std::deque<double> history_;
};

// Moran's I with rook adjacency (cells at Manhattan distance 1).
// Points are (row, col, value). Returns nullopt when fewer than three
// points, no adjacent pairs, or zero variance.
struct GridPoint {
    int row;
    int col;
    double value;
};

inline std::optional<double> morans_i(const std::vector<GridPoint>& points) {
    size_t n = points.size();
    if (n < 3) return std::nullopt;

    double mean = 0.0;
    for (const auto& p : points) mean += p.value;
    mean /= static_cast<double>(n);

    double denom = 0.0;
    for (const auto& p : points) denom += (p.value - mean) * (p.value - mean);
    if (denom <= 0.0) return std::nullopt;

    double num = 0.0;
    double w_total = 0.0;
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            if (i == j) continue;
            int dist = std::abs(points[i].row - points[j].row) +
                       std::abs(points[i].col - points[j].col);
            if (dist != 1) continue;
            w_total += 1.0;
            num += (points[i].value - mean) * (points[j].value - mean);
        }
    }
    if (w_total <= 0.0) return std::nullopt;

    return (static_cast<double>(n) / w_total) * (num / denom);
}

} // namespace stats
} // namespace episteme
