#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <span>
#include <stdexcept>
#include <vector>

namespace tempo::stats {

    inline double mean(std::span<const double> values) {
        if (values.empty()) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        double sum = 0.0;
        for (auto v : values) {
            sum += v;
        }
        return sum / static_cast<double>(values.size());
    }

    // Population standard deviation.
    inline double standard_deviation(std::span<const double> values) {
        if (values.empty()) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        auto m = mean(values);
        double sum_sq = 0.0;
        for (auto v : values) {
            sum_sq += (v - m) * (v - m);
        }
        return std::sqrt(sum_sq / static_cast<double>(values.size()));
    }

    /*
     * Quantile of an ascending series without interpolation: p * n rounded up selects
     * the sample, an exact integer position on an even-sized series averages the two
     * neighbours.
     */
    inline double quantile_sorted(std::span<const double> sorted, double p) {
        if (sorted.empty()) {
            throw std::invalid_argument("quantile requires at least one sample");
        }
        if (p < 0.0 || p > 1.0) {
            throw std::invalid_argument("quantile must be between 0 and 1");
        }
        if (p == 1.0) {
            return sorted.back();
        }
        if (p == 0.0) {
            return sorted.front();
        }
        auto idx = static_cast<double>(sorted.size()) * p;
        if (std::floor(idx) != idx) {
            return sorted[static_cast<size_t>(std::ceil(idx)) - 1U];
        }
        auto i = static_cast<size_t>(idx);
        if (sorted.size() % 2U == 0U) {
            return (sorted[i - 1U] + sorted[i]) / 2.0;
        }
        return sorted[i];
    }

    enum class fence_side { all, upper, lower };

    /*
     * Tukey's fences over an ascending series: samples outside
     * [Q1 - k*IQR, Q3 + k*IQR] are outliers.
     */
    class tukey_outlier_detector {
      public:
        explicit tukey_outlier_detector(std::span<const double> sorted, double k = 1.5) {
            if (sorted.empty()) {
                return;
            }
            auto q1 = quantile_sorted(sorted, 0.25);
            auto q3 = quantile_sorted(sorted, 0.75);
            auto iqr = q3 - q1;
            lower_fence_ = q1 - k * iqr;
            upper_fence_ = q3 + k * iqr;
        }

        double lower_fence() const { return lower_fence_; }
        double upper_fence() const { return upper_fence_; }

        bool is_outlier(double value, fence_side side) const {
            switch (side) {
                case fence_side::upper:
                    return value > upper_fence_;
                case fence_side::lower:
                    return value < lower_fence_;
                case fence_side::all:
                    return value < lower_fence_ || value > upper_fence_;
            }
            return false;
        }

        std::vector<double> filter(std::span<const double> values, fence_side side) const {
            std::vector<double> kept{};
            kept.reserve(values.size());
            for (auto v : values) {
                if (!is_outlier(v, side)) {
                    kept.push_back(v);
                }
            }
            return kept;
        }

      private:
        double lower_fence_{-std::numeric_limits<double>::infinity()};
        double upper_fence_{std::numeric_limits<double>::infinity()};
    };

}  // namespace tempo::stats
