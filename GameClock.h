#pragma once

#include <cstdint>

struct GameClockConfig {
    double fixedDeltaTime = 1.0 / 60.0;
    double timeScale = 1.0;
    double maxDeltaTime = 0.1;
    double fpsUpdateInterval = 0.5;
};

// Turns raw monotonic timestamps into the delta the driving loop feeds to
// World::Update: clamped, scaled, pausable, with a fixed-step accumulator.
class GameClock {
public:
    static constexpr double MIN_DELTA_TIME = 0.0001;

    explicit GameClock(const GameClockConfig& config = {});

    // First call after Reset() only establishes the reference point.
    void Reset();
    void Tick(double nowSeconds);

    // Consumes one fixed step from the accumulator when available.
    bool ShouldRunFixedUpdate();

    double GetDeltaTime() const { return mDeltaTime; }
    double GetElapsedTime() const { return mElapsedTime; }
    double GetFps() const { return mFps; }
    std::uint64_t GetFrameCount() const { return mTotalFrames; }

    double GetFixedDeltaTime() const { return mFixedDeltaTime; }
    void   SetFixedDeltaTime(double value);

    double GetTimeScale() const { return mTimeScale; }
    void   SetTimeScale(double value);

    double GetMaxDeltaTime() const { return mMaxDeltaTime; }
    void   SetMaxDeltaTime(double value);

    bool IsPaused() const { return mPaused; }
    void SetPaused(bool paused);

private:
    GameClockConfig mConfig;

    double mFixedDeltaTime = 0.0;
    double mTimeScale = 1.0;
    double mMaxDeltaTime = 0.0;

    double mDeltaTime = 0.0;
    double mElapsedTime = 0.0;
    double mLastTime = 0.0;
    bool   mHasLastTime = false;
    bool   mPaused = false;

    double mFps = 0.0;
    double mFpsAccumulator = 0.0;
    std::uint64_t mFpsFrames = 0;
    std::uint64_t mTotalFrames = 0;

    double mFixedAccumulator = 0.0;
};
