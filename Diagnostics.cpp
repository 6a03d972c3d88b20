#include "Diagnostics.h"

#include <iomanip>
#include <iostream>
#include <ostream>

namespace diag {

    Diagnostics::Diagnostics(const DiagnosticsConfig& cfg)
        : cfg_(cfg)
        , metrics_(cfg.historyFrames)
        , mode_(cfg.mode) {
    }

    void Diagnostics::beginFrame(std::uint64_t frameIdx) {
        frameIdx_ = frameIdx;
        if (recording()) {
            metrics_.openFrame(frameIdx);
        }
    }

    void Diagnostics::endFrame(std::uint64_t frameIdx, double cpuFrameMs) {
        if (!recording()) return;

        const FrameRecord& frame = metrics_.closeFrame(cpuFrameMs);
        if (mode_ == ProfilerMode::Full && frame.spike) {
            const SystemTiming* worst = metrics_.slowestSystem();
            std::cerr << "[Diagnostics] Frame " << frameIdx << " spike: "
                << std::fixed << std::setprecision(3) << cpuFrameMs << " ms (median "
                << metrics_.distribution().median << " ms)";
            if (worst) {
                std::cerr << ", slowest system " << worst->name << " " << worst->ms << " ms";
            }
            std::cerr << "\n";
        }
    }

    void Diagnostics::addCpuScope(const std::string& name, double ms) {
        if (recording()) {
            metrics_.recordSystem(name, ms);
        }
    }

    void Diagnostics::reportListenerFault(const std::string& eventType, const std::string& message) {
        ++faultCount_;
        std::cerr << "[EventBus] Error in event listener for " << eventType << ": " << message << "\n";

        if (cfg_.maxRecordedFaults == 0) return;
        while (faults_.size() >= cfg_.maxRecordedFaults) {
            faults_.pop_front();
        }
        faults_.push_back(ListenerFault{ eventType, message, frameIdx_ });
    }

    void Diagnostics::reportWarning(const std::string& source, const std::string& message) {
        ++warningCount_;
        std::cerr << "[" << source << "] " << message << "\n";
    }

    void Diagnostics::printSummary(std::ostream& out) const {
        const Distribution& dist = metrics_.distribution();
        const WorldGauges& g = metrics_.gauges();

        out << "[Diagnostics] frames=" << metrics_.framesClosed()
            << " entities=" << g.entities
            << " systems=" << g.systems
            << " pooled=" << g.pooledComponents
            << " faults=" << faultCount_
            << " warnings=" << warningCount_ << "\n";

        if (metrics_.history().empty()) return;

        const auto flags = out.flags();
        const auto precision = out.precision();
        out << std::fixed << std::setprecision(3)
            << "[Diagnostics] frame ms median=" << dist.median
            << " p95=" << dist.p95
            << " p99=" << dist.p99
            << " max=" << dist.max
            << " mean=" << metrics_.history().mean() << "\n";
        for (const SystemTiming& t : metrics_.systemTimings()) {
            out << "[Diagnostics]   " << t.name << ": " << t.ms << " ms x" << t.calls << "\n";
        }
        out.flags(flags);
        out.precision(precision);
    }

    void Diagnostics::reset() {
        metrics_ = MetricsRegistry(cfg_.historyFrames);
        frameIdx_ = 0;
        faultCount_ = 0;
        warningCount_ = 0;
        faults_.clear();
    }

}
