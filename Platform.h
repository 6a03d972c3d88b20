#pragma once

#include <cstdint>

namespace plat {

    struct InitParams {
        bool enableEvents = false;
    };

    // Headless init: only the high-resolution counter is needed.
    bool Init(const InitParams& params = {});
    void Shutdown();
    bool IsInitialized();

    using Ticks = std::uint64_t;

    Ticks  GetTicks();
    double TicksToSeconds(Ticks dt);

    // Seconds since Init(); 0 before it.
    double GetTimeSeconds();

    void SleepSeconds(double seconds);

}
