/*
 * InfoHud - Copyright (C) 2025 Jacob Wirth & Justin Li
 *
 * This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#pragma once

#include "common/Common.hh"

#include <array>
#include <optional>

namespace hud {
    struct FpsColorThreshold {
        float upperBound; // exclusive
        const char *hexColor;
    };

    // Scanned in ascending order, the first entry with fps < upperBound wins.
    extern const std::array<FpsColorThreshold, 5> FpsColorThresholds;

    // Shown whenever no frame rate can be computed
    extern const char *const FpsPlaceholderText;

    const char *FpsColor(float fps);

    // Formats the floor of fps, optionally wrapped in a <color> tag picked from FpsColorThresholds.
    string FormatFps(float fps, bool colorCode);

    /*
     * Averages the frame rate over a fixed window of the most recent frame durations.
     *
     * Sample() is expected once per tick. The window sum is kept up to date incrementally, so the current
     * frame rate (capacity / sum) is cheap to read at any time. MaybePublish() only reformats the display
     * text once publishInterval seconds have passed since the previous publish.
     *
     * Not thread safe; owned and driven by a single frame loop.
     */
    class FrameRateEstimator {
    public:
        // Throws std::invalid_argument if windowCapacity <= 0 or publishInterval < 0.
        FrameRateEstimator(int windowCapacity,
            float publishInterval,
            bool colorCode,
            float initialDuration,
            float startTime);

        // Replaces the oldest duration in the window. Negative and non-finite durations are ignored,
        // returns false if the sample was ignored.
        bool Sample(float frameDuration);

        // Time weighted average frame rate over the window, none if the window sum is zero.
        std::optional<float> CurrentFps() const;

        // Returns newly formatted text if the publish interval has elapsed, none otherwise.
        std::optional<string> MaybePublish(float now);

        size_t Capacity() const {
            return frameDurations.size();
        }

        double WindowSum() const {
            return sampleSum;
        }

        float PublishInterval() const {
            return publishInterval;
        }

        bool ColorCoded() const {
            return colorCode;
        }

        float LastPublishTime() const {
            return lastPublishTime;
        }

        const vector<float> &Window() const {
            return frameDurations;
        }

    private:
        vector<float> frameDurations;
        double sampleSum = 0.0;
        size_t currentSample = 0;

        float publishInterval;
        float lastPublishTime;
        bool colorCode;
    };
} // namespace hud
