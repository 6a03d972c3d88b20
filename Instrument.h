#pragma once

#include "Chrono.h"
#include "Diagnostics.h"

#include <string>
#include <utility>

namespace diag {

	// Reports the lifetime of the enclosing scope as one CPU sample.
	class ScopedCpuZone {
	public:
		ScopedCpuZone(Diagnostics& diagnostics, std::string name)
			: diagnostics_(diagnostics), name_(std::move(name)) {}
		~ScopedCpuZone() { diagnostics_.addCpuScope(name_, timer_.elapsedMs()); }

		ScopedCpuZone(const ScopedCpuZone&) = delete;
		ScopedCpuZone& operator=(const ScopedCpuZone&) = delete;

	private:
		Diagnostics& diagnostics_;
		std::string name_;
		Stopwatch timer_;
	};

}

#define STROLL_DIAG_CONCAT_INNER(a, b) a##b
#define STROLL_DIAG_CONCAT(a, b) STROLL_DIAG_CONCAT_INNER(a, b)

#if STROLL_DIAG_ENABLE
#define STROLL_ZONE_CPU(diagnostics, name) ::diag::ScopedCpuZone STROLL_DIAG_CONCAT(_stroll_cpu_zone_, __LINE__){diagnostics, name}
#else
#define STROLL_ZONE_CPU(diagnostics, name) (void)0
#endif
