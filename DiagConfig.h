#pragma once

#include <cstddef>

// Compile-time switch for STROLL_ZONE_CPU scopes.
#ifndef STROLL_DIAG_ENABLE
#define STROLL_DIAG_ENABLE 1
#endif

namespace diag {

	enum class ProfilerMode {
		Off,            // fault and warning counters only
		RollingMinimal, // frame history and per-system timings
		Full            // also logs frame spikes
	};

	struct DiagnosticsConfig {
		ProfilerMode mode = ProfilerMode::RollingMinimal;
		std::size_t historyFrames = 600;
		std::size_t maxRecordedFaults = 64;
	};

}
