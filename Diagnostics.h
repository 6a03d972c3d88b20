#pragma once

#include "DiagConfig.h"
#include "Metrics.h"

#include <cstdint>
#include <deque>
#include <iosfwd>
#include <string>

namespace diag {

    struct ListenerFault {
        std::string eventType;
        std::string message;
        std::uint64_t frameIdx = 0;
    };

    // Per-World diagnostics sink: frame timing, per-system scopes, and the
    // faults the event bus isolates during dispatch. Counters keep running
    // when the profiler mode is Off.
    class Diagnostics {
    public:
        explicit Diagnostics(const DiagnosticsConfig& cfg = {});

        void beginFrame(std::uint64_t frameIdx);
        void endFrame(std::uint64_t frameIdx, double cpuFrameMs);
        void setMode(ProfilerMode m) { mode_ = m; }
        ProfilerMode mode() const { return mode_; }

        void addCpuScope(const std::string& name, double ms);
        void publishGauges(const WorldGauges& g) { metrics_.publishGauges(g); }

        void reportListenerFault(const std::string& eventType, const std::string& message);
        void reportWarning(const std::string& source, const std::string& message);

        std::uint64_t listenerFaultCount() const { return faultCount_; }
        std::uint64_t warningCount() const { return warningCount_; }
        const std::deque<ListenerFault>& recentFaults() const { return faults_; }

        void printSummary(std::ostream& out) const;
        void reset();

        MetricsRegistry& metrics() { return metrics_; }
        const MetricsRegistry& metrics() const { return metrics_; }

    private:
        bool recording() const { return mode_ != ProfilerMode::Off; }

        DiagnosticsConfig cfg_{};
        MetricsRegistry metrics_;
        ProfilerMode mode_ = ProfilerMode::RollingMinimal;
        std::uint64_t frameIdx_ = 0;
        std::uint64_t faultCount_ = 0;
        std::uint64_t warningCount_ = 0;
        std::deque<ListenerFault> faults_;
    };

}
