/*
 * InfoHud - Copyright (C) 2025 Jacob Wirth & Justin Li
 *
 * This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "FrameRateEstimator.hh"

#include "common/Logging.hh"

#include <cmath>
#include <cstdio>
#include <limits>
#include <stdexcept>

namespace hud {
    const std::array<FpsColorThreshold, 5> FpsColorThresholds = {{
        {30.0f, "#ff0000"},
        {60.0f, "#ffff00"},
        {120.0f, "#00ff00"},
        {240.0f, "#00ffff"},
        {std::numeric_limits<float>::infinity(), "#ff00ff"},
    }};

    const char *const FpsPlaceholderText = "<b>FPS:</b> N/A";

    const char *FpsColor(float fps) {
        for (auto &threshold : FpsColorThresholds) {
            if (fps < threshold.upperBound) return threshold.hexColor;
        }
        return FpsColorThresholds.back().hexColor;
    }

    string FormatFps(float fps, bool colorCode) {
        if (!std::isfinite(fps)) return FpsPlaceholderText;

        char numeral[64];
        std::snprintf(numeral, sizeof(numeral), "%.0f", std::floor((double)fps));

        if (!colorCode) return "<b>FPS:</b> "s + numeral;
        return "<b>FPS:</b> <color="s + FpsColor(fps) + ">" + numeral + "</color>";
    }

    FrameRateEstimator::FrameRateEstimator(int windowCapacity,
        float publishInterval,
        bool colorCode,
        float initialDuration,
        float startTime)
        : publishInterval(publishInterval), lastPublishTime(startTime), colorCode(colorCode) {
        if (windowCapacity <= 0) {
            throw std::invalid_argument("frame rate window capacity must be positive: " +
                                        std::to_string(windowCapacity));
        }
        if (!(publishInterval >= 0.0f)) {
            throw std::invalid_argument("frame rate publish interval must not be negative: " +
                                        std::to_string(publishInterval));
        }
        if (!std::isfinite(initialDuration) || initialDuration < 0.0f) initialDuration = 0.0f;

        frameDurations.assign(windowCapacity, initialDuration);
        sampleSum = (double)windowCapacity * initialDuration;
    }

    bool FrameRateEstimator::Sample(float frameDuration) {
        if (!std::isfinite(frameDuration) || frameDuration < 0.0f) {
            Tracef("Ignoring invalid frame duration sample: %f", frameDuration);
            return false;
        }

        float &slot = frameDurations[currentSample];
        sampleSum += (double)frameDuration - (double)slot;
        slot = frameDuration;

        currentSample = (currentSample + 1) % frameDurations.size();
        return true;
    }

    std::optional<float> FrameRateEstimator::CurrentFps() const {
        if (!(sampleSum > 0.0)) return {};

        double fps = (double)frameDurations.size() / sampleSum;
        if (!std::isfinite(fps)) return {};
        return (float)fps;
    }

    std::optional<string> FrameRateEstimator::MaybePublish(float now) {
        if (now - lastPublishTime < publishInterval) return {};
        lastPublishTime = now;

        auto fps = CurrentFps();
        if (!fps) return FpsPlaceholderText;
        return FormatFps(*fps, colorCode);
    }
} // namespace hud
