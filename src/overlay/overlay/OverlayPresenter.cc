/*
 * InfoHud - Copyright (C) 2025 Jacob Wirth & Justin Li
 *
 * This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "OverlayPresenter.hh"

#include "common/Logging.hh"
#include "common/Tracing.hh"

#include <stdexcept>

namespace hud {
    OverlayConfig WithInvalidFieldsDefaulted(const OverlayConfig &config) {
        OverlayConfig defaults;
        OverlayConfig result = config;
        if (result.fpsSampleCount <= 0) {
            Warnf("Invalid FPS sample count %d, using %d", result.fpsSampleCount, defaults.fpsSampleCount);
            result.fpsSampleCount = defaults.fpsSampleCount;
        }
        if (!(result.fpsUpdateDelay >= 0.0f)) {
            Warnf("Invalid FPS update delay %f, using %f", result.fpsUpdateDelay, defaults.fpsUpdateDelay);
            result.fpsUpdateDelay = defaults.fpsUpdateDelay;
        }
        return result;
    }

    OverlayPresenter::OverlayPresenter(const OverlayConfig &config,
        const HardwareInfo &hardware,
        DisplaySettingsSource &displaySource,
        bool isEditor,
        float initialFrameDuration,
        float startTime)
        : config(config), displaySource(displaySource), isEditor(isEditor),
          estimator(config.fpsSampleCount, config.fpsUpdateDelay, config.colorCodeFps, initialFrameDuration, startTime),
          hardwareText(FormatHardwareInfo(hardware)) {
        if (!IsEnabled()) Debugf("Overlay only shown in editor builds");
        compose();
    }

    void OverlayPresenter::Tick(float frameDuration, float now) {
        ZoneScoped;
        estimator.Sample(frameDuration);

        auto published = estimator.MaybePublish(now);
        if (published) {
            ZoneStr(*published);
            fpsText = std::move(*published);
        }

        compose();
    }

    bool OverlayPresenter::Configure(const OverlayConfig &newConfig, float now) {
        if (newConfig.fpsSampleCount != config.fpsSampleCount || newConfig.fpsUpdateDelay != config.fpsUpdateDelay ||
            newConfig.colorCodeFps != config.colorCodeFps) {
            // Seed the new window with the current average so the reading does not jump
            float seed = 0.0f;
            auto fps = estimator.CurrentFps();
            if (fps) seed = 1.0f / *fps;

            try {
                estimator = FrameRateEstimator(newConfig.fpsSampleCount,
                    newConfig.fpsUpdateDelay,
                    newConfig.colorCodeFps,
                    seed,
                    now);
            } catch (const std::invalid_argument &err) {
                Errorf("Invalid overlay config: %s", err.what());
                return false;
            }
        }
        if (newConfig.showOnlyInEditor != config.showOnlyInEditor && !isEditor) {
            Debugf("Overlay %s", newConfig.showOnlyInEditor ? "hidden outside the editor" : "no longer editor only");
        }
        config = newConfig;
        return true;
    }

    void OverlayPresenter::SetEnabled(bool enabled) {
        if (this->enabled != enabled) Debugf("Overlay %s", enabled ? "enabled" : "disabled");
        this->enabled = enabled;
    }

    void OverlayPresenter::compose() {
        auto settings = displaySource.Current();

        text = fpsText + "<br>" + hardwareText + "<br>" + FormatResolution(settings) + "<br>" +
               FormatWindowMode(settings.windowMode) + "<br>" + FormatVSync(settings.vsyncCount) + "<br>" +
               FormatQualityLevel(settings);
    }
} // namespace hud
