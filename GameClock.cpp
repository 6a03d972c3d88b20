#include "GameClock.h"

#include <algorithm>

GameClock::GameClock(const GameClockConfig& config)
    : mConfig(config)
{
    Reset();
}

void GameClock::Reset() {
    mFixedDeltaTime = std::max(MIN_DELTA_TIME, mConfig.fixedDeltaTime);
    mTimeScale = std::max(0.0, mConfig.timeScale);
    mMaxDeltaTime = std::max(MIN_DELTA_TIME, mConfig.maxDeltaTime);

    mDeltaTime = 0.0;
    mElapsedTime = 0.0;
    mLastTime = 0.0;
    mHasLastTime = false;
    mPaused = false;

    mFps = 0.0;
    mFpsAccumulator = 0.0;
    mFpsFrames = 0;
    mTotalFrames = 0;
    mFixedAccumulator = 0.0;
}

void GameClock::Tick(double nowSeconds) {
    if (!mHasLastTime) {
        mLastTime = nowSeconds;
        mHasLastTime = true;
        mDeltaTime = 0.0;
        return;
    }

    double raw = nowSeconds - mLastTime;
    mLastTime = nowSeconds;

    // Monotonic sources never go back, but a reset source might.
    raw = std::clamp(raw, 0.0, mMaxDeltaTime);

    if (mPaused) {
        mDeltaTime = 0.0;
        return;
    }

    mDeltaTime = raw * mTimeScale;
    mElapsedTime += mDeltaTime;
    ++mTotalFrames;

    mFpsAccumulator += raw;
    ++mFpsFrames;
    if (mFpsAccumulator >= mConfig.fpsUpdateInterval && mFpsAccumulator > 0.0) {
        mFps = static_cast<double>(mFpsFrames) / mFpsAccumulator;
        mFpsFrames = 0;
        mFpsAccumulator = 0.0;
    }

    mFixedAccumulator += mDeltaTime;
}

bool GameClock::ShouldRunFixedUpdate() {
    if (mFixedAccumulator >= mFixedDeltaTime) {
        mFixedAccumulator -= mFixedDeltaTime;
        return true;
    }
    return false;
}

void GameClock::SetFixedDeltaTime(double value) {
    mFixedDeltaTime = std::max(MIN_DELTA_TIME, value);
}

void GameClock::SetTimeScale(double value) {
    mTimeScale = std::max(0.0, value);
}

void GameClock::SetMaxDeltaTime(double value) {
    mMaxDeltaTime = std::max(MIN_DELTA_TIME, value);
}

void GameClock::SetPaused(bool paused) {
    if (mPaused == paused) return;
    mPaused = paused;
    if (!paused) {
        // Resume from the next timestamp instead of counting the pause.
        mHasLastTime = false;
    }
}
