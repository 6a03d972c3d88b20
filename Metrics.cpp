#include "Metrics.h"

#include <algorithm>

namespace diag {

    MetricsRegistry::MetricsRegistry(std::size_t historyFrames)
        : history_(historyFrames) {
    }

    void MetricsRegistry::openFrame(std::uint64_t index) {
        open_ = FrameRecord{};
        open_.index = index;
        pending_.clear();
    }

    void MetricsRegistry::recordSystem(const std::string& name, double ms) {
        // A handful of systems per frame; a linear lookup is enough.
        auto it = std::find_if(pending_.begin(), pending_.end(),
            [&name](const SystemTiming& t) { return t.name == name; });
        if (it == pending_.end()) {
            pending_.push_back(SystemTiming{ name, 0.0, 0 });
            it = pending_.end() - 1;
        }
        it->ms += ms;
        it->calls += 1;
        open_.systemsUpdated += 1;
    }

    const FrameRecord& MetricsRegistry::closeFrame(double cpuMs) {
        open_.cpu_ms = cpuMs;
        history_.push(cpuMs);
        dist_ = summarize(history_.snapshot());
        open_.spike = is_spike(cpuMs, dist_, history_.size());

        timings_.swap(pending_);
        pending_.clear();
        std::stable_sort(timings_.begin(), timings_.end(),
            [](const SystemTiming& a, const SystemTiming& b) { return a.ms > b.ms; });

        last_ = open_;
        ++framesClosed_;
        return last_;
    }

}
