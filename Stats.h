#pragma once

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <vector>

namespace diag {

    // Keeps the most recent capacity() samples; older ones are overwritten.
    template <typename T>
    class RollingWindow {
    public:
        explicit RollingWindow(std::size_t capacity = 600)
            : ring_(capacity > 0 ? capacity : 1) {}

        void push(const T& sample) {
            if (count_ < ring_.size()) {
                ring_[(first_ + count_) % ring_.size()] = sample;
                ++count_;
            }
            else {
                ring_[first_] = sample;
                first_ = (first_ + 1) % ring_.size();
            }
        }

        void clear() { first_ = 0; count_ = 0; }

        // Oldest first.
        std::vector<T> snapshot() const {
            std::vector<T> out;
            out.reserve(count_);
            for (std::size_t i = 0; i < count_; ++i) {
                out.push_back(ring_[(first_ + i) % ring_.size()]);
            }
            return out;
        }

        const T& latest() const { return ring_[(first_ + count_ - 1) % ring_.size()]; }

        T mean() const {
            if (count_ == 0) return T{};
            const std::vector<T> v = snapshot();
            return std::accumulate(v.begin(), v.end(), T{}) / static_cast<T>(count_);
        }

        std::size_t size() const { return count_; }
        bool empty() const { return count_ == 0; }
        std::size_t capacity() const { return ring_.size(); }

    private:
        std::vector<T> ring_;
        std::size_t first_ = 0;
        std::size_t count_ = 0;
    };

    struct Distribution {
        double median = 0.0;
        double p95 = 0.0;
        double p99 = 0.0;
        double q1 = 0.0;
        double q3 = 0.0;
        double max = 0.0;

        double iqr() const { return q3 - q1; }
    };

    // Linear interpolation between closest ranks; sorted must be ascending.
    inline double quantile_sorted(const std::vector<double>& sorted, double q) {
        if (sorted.empty()) return 0.0;
        const double pos = q * double(sorted.size() - 1);
        const std::size_t lo = std::size_t(pos);
        const std::size_t hi = std::min(lo + 1, sorted.size() - 1);
        const double frac = pos - double(lo);
        return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
    }

    inline Distribution summarize(std::vector<double> samples) {
        Distribution d{};
        if (samples.empty()) return d;
        std::sort(samples.begin(), samples.end());
        d.median = quantile_sorted(samples, 0.50);
        d.p95 = quantile_sorted(samples, 0.95);
        d.p99 = quantile_sorted(samples, 0.99);
        d.q1 = quantile_sorted(samples, 0.25);
        d.q3 = quantile_sorted(samples, 0.75);
        d.max = samples.back();
        return d;
    }

    constexpr std::size_t kMinSpikeSamples = 8;

    // Tukey fence on the frame-time distribution.
    inline bool is_spike(double x, const Distribution& d, std::size_t samples) {
        if (samples < kMinSpikeSamples) return false;
        const double fence = 1.5 * d.iqr();
        return x < d.q1 - fence || x > d.q3 + fence;
    }

}
