/*
 * InfoHud - Copyright (C) 2025 Jacob Wirth & Justin Li
 *
 * This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#pragma once

#include "common/Common.hh"
#include "overlay/DisplaySettings.hh"
#include "overlay/FrameRateEstimator.hh"
#include "overlay/SystemInfo.hh"

namespace hud {
    struct OverlayConfig {
        // Number of frames to average for the FPS
        int fpsSampleCount = 30;
        // Delay between FPS text updates, in seconds
        float fpsUpdateDelay = 0.5f;
        bool colorCodeFps = true;
        bool showOnlyInEditor = false;
    };

    // Returns a copy of config with every out-of-range field reset to its default value.
    OverlayConfig WithInvalidFieldsDefaulted(const OverlayConfig &config);

    /*
     * Builds the overlay text: the FPS line, the hardware info captured at construction, and the current
     * display settings. The text is rebuilt every Tick(), whether or not the overlay is visible.
     */
    class OverlayPresenter : public NonCopyable {
    public:
        // Throws std::invalid_argument if the config is not valid.
        OverlayPresenter(const OverlayConfig &config,
            const HardwareInfo &hardware,
            DisplaySettingsSource &displaySource,
            bool isEditor,
            float initialFrameDuration,
            float startTime);

        void Tick(float frameDuration, float now);

        // Returns false and keeps the current config if the new one is invalid.
        bool Configure(const OverlayConfig &newConfig, float now);

        void SetEnabled(bool enabled);

        // False while disabled with SetEnabled(), or when showOnlyInEditor is set outside an editor build.
        bool IsEnabled() const {
            return enabled && !(config.showOnlyInEditor && !isEditor);
        }

        const string &Text() const {
            return text;
        }

        const string &FpsText() const {
            return fpsText;
        }

        const string &HardwareText() const {
            return hardwareText;
        }

        const OverlayConfig &Config() const {
            return config;
        }

        const FrameRateEstimator &Estimator() const {
            return estimator;
        }

    private:
        void compose();

        OverlayConfig config;
        DisplaySettingsSource &displaySource;
        const bool isEditor;
        FrameRateEstimator estimator;

        bool enabled = true;
        string hardwareText;
        string fpsText = FpsPlaceholderText;
        string text;
    };
} // namespace hud
