#pragma once

#include <algorithm>
#include <cmath>

// Time dilation for freeze frames and slow motion. Updated with unscaled time.
class TimeScale {
public:
    static constexpr float TRANSITION_SPEED = 10.0f;   // scale units per second
    static constexpr float MAX_SCALE = 2.0f;

    float GetScale() const { return currentScale; }

    float Apply(float deltaMs) const { return deltaMs * currentScale; }

    void Update(float deltaMs) {
        if (timerMs > 0.0f) {
            timerMs -= deltaMs;
            if (timerMs <= 0.0f) {
                targetScale = 1.0f;
                timerMs = 0.0f;
            }
        }

        if (currentScale != targetScale) {
            float diff = targetScale - currentScale;
            float step = TRANSITION_SPEED * (deltaMs / 1000.0f);
            if (std::fabs(diff) < step) {
                currentScale = targetScale;
            } else {
                currentScale += (diff > 0.0f ? step : -step);
            }
        }
    }

    // Brief hard slowdown, applied immediately
    void Freeze(float durationMs, float scale = 0.1f) {
        currentScale = scale;
        targetScale = scale;
        timerMs = durationMs;
    }

    // Eases toward the scale; durationMs of 0 keeps it until Reset
    void SetScale(float scale, float durationMs = 0.0f) {
        targetScale = std::clamp(scale, 0.0f, MAX_SCALE);
        if (durationMs > 0.0f) {
            timerMs = durationMs;
        }
    }

    void Reset() {
        currentScale = 1.0f;
        targetScale = 1.0f;
        timerMs = 0.0f;
    }

    bool IsActive() const { return currentScale != 1.0f || timerMs > 0.0f; }

private:
    float currentScale = 1.0f;
    float targetScale = 1.0f;
    float timerMs = 0.0f;
};
