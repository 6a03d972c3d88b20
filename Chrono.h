#pragma once

#include <chrono>
#include <cstdint>

namespace diag {

	using SteadyClock = std::chrono::steady_clock;

	// Monotonic nanoseconds; only differences are meaningful.
	inline std::int64_t now_ns() {
		using namespace std::chrono;
		return duration_cast<nanoseconds>(SteadyClock::now().time_since_epoch()).count();
	}

	class Stopwatch {
	public:
		Stopwatch() : start_ns_(now_ns()) {}

		void restart() { start_ns_ = now_ns(); }
		std::int64_t elapsedNs() const { return now_ns() - start_ns_; }
		double elapsedMs() const { return double(elapsedNs()) * 1e-6; }

	private:
		std::int64_t start_ns_;
	};

}
