#pragma once

#include "Stats.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace diag {

    // Accumulated cost of one system (or named zone) within a frame.
    struct SystemTiming {
        std::string name;
        double ms = 0.0;
        int calls = 0;
    };

    struct FrameRecord {
        std::uint64_t index = 0;
        double cpu_ms = 0.0;
        bool spike = false;
        std::uint32_t systemsUpdated = 0;
    };

    struct WorldGauges {
        std::uint64_t entities = 0;
        std::uint64_t systems = 0;
        std::uint64_t pooledComponents = 0;
    };

    // Frame-time history plus the per-system breakdown of the last closed frame.
    class MetricsRegistry {
    public:
        explicit MetricsRegistry(std::size_t historyFrames = 600);

        void openFrame(std::uint64_t index);
        void recordSystem(const std::string& name, double ms);
        const FrameRecord& closeFrame(double cpuMs);

        void publishGauges(const WorldGauges& g) { gauges_ = g; }

        std::uint64_t framesClosed() const { return framesClosed_; }
        const FrameRecord& lastFrame() const { return last_; }
        const RollingWindow<double>& history() const { return history_; }
        const Distribution& distribution() const { return dist_; }

        // Slowest first.
        const std::vector<SystemTiming>& systemTimings() const { return timings_; }
        const SystemTiming* slowestSystem() const { return timings_.empty() ? nullptr : &timings_.front(); }

        const WorldGauges& gauges() const { return gauges_; }

    private:
        RollingWindow<double> history_;
        Distribution dist_{};

        FrameRecord open_{};
        FrameRecord last_{};
        std::vector<SystemTiming> pending_;
        std::vector<SystemTiming> timings_;

        WorldGauges gauges_{};
        std::uint64_t framesClosed_ = 0;
    };

}
