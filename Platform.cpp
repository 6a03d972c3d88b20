#include "Platform.h"

#include <SDL3/SDL.h>

#include <iostream>

namespace plat {

    namespace {
        struct ClockState {
            Ticks frequency = 0;
            Ticks origin = 0;
            bool  ready = false;
        };

        ClockState& state() {
            static ClockState s;
            return s;
        }

        Ticks frequency() {
            ClockState& s = state();
            if (s.frequency == 0) {
                s.frequency = SDL_GetPerformanceFrequency();
            }
            return s.frequency;
        }
    }

    bool Init(const InitParams& params) {
        ClockState& s = state();
        if (s.ready) return true;

        const SDL_InitFlags flags = params.enableEvents ? SDL_INIT_EVENTS : 0;
        if (!SDL_Init(flags)) {
            const char* err = SDL_GetError();
            std::cerr << "[Platform] SDL_Init failed: " << (err && *err ? err : "(no message)") << "\n";
            return false;
        }

        s.frequency = SDL_GetPerformanceFrequency();
        s.origin = SDL_GetPerformanceCounter();
        s.ready = true;
        return true;
    }

    void Shutdown() {
        ClockState& s = state();
        if (!s.ready) return;
        SDL_Quit();
        s = ClockState{};
    }

    bool IsInitialized() {
        return state().ready;
    }

    Ticks GetTicks() {
        return SDL_GetPerformanceCounter();
    }

    double TicksToSeconds(Ticks dt) {
        return static_cast<double>(dt) / static_cast<double>(frequency());
    }

    double GetTimeSeconds() {
        const ClockState& s = state();
        return s.ready ? TicksToSeconds(GetTicks() - s.origin) : 0.0;
    }

    void SleepSeconds(double seconds) {
        if (seconds > 0.0) {
            SDL_DelayNS(static_cast<Uint64>(seconds * 1e9));
        }
    }

}
