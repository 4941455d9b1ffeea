/*
 * InfoHud - Copyright (C) 2025 Jacob Wirth & Justin Li
 *
 * This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "OverlayThread.hh"

#include "common/Tracing.hh"

#include <stdexcept>

namespace hud {
    CVar<bool> CVarShowOverlay("hud.Show", true, "Show the system info overlay");
    CVar<int> CVarFpsSampleCount("hud.FpsSampleCount", 30, "Number of frames to average for the FPS");
    CVar<float> CVarFpsUpdateDelay("hud.FpsUpdateDelay", 0.5f, "Delay between FPS updates (in seconds)");
    CVar<bool> CVarColorCodeFps("hud.ColorCodeFps", true, "Color the FPS based on how high it is");
    CVar<bool> CVarShowOnlyInEditor("hud.ShowOnlyInEditor", false, "Only show the overlay in editor builds");

    OverlayConfig ConfigFromCVars(bool setClean) {
        OverlayConfig config;
        config.fpsSampleCount = CVarFpsSampleCount.Get(setClean);
        config.fpsUpdateDelay = CVarFpsUpdateDelay.Get(setClean);
        config.colorCodeFps = CVarColorCodeFps.Get(setClean);
        config.showOnlyInEditor = CVarShowOnlyInEditor.Get(setClean);
        return config;
    }

    OverlayThread::OverlayThread(const HardwareInfo &hardware,
        DisplaySettingsSource &displaySource,
        bool isEditor,
        double tickRate)
        : RegisteredThread("Overlay", tickRate, true), hardware(hardware), displaySource(displaySource),
          isEditor(isEditor) {}

    OverlayThread::~OverlayThread() {
        // The presenter must not be destroyed while a frame is running
        StopThread();
    }

    bool OverlayThread::ThreadInit() {
        startTime = chrono_clock::now();
        lastFrameTime = startTime;
        return true;
    }

    void OverlayThread::createPresenter(float frameDuration, float now) {
        auto config = ConfigFromCVars(true);
        try {
            presenter = make_unique<OverlayPresenter>(config, hardware, displaySource, isEditor, frameDuration, now);
        } catch (const std::invalid_argument &err) {
            Errorf("Invalid overlay config, using defaults for invalid fields: %s", err.what());
            presenter = make_unique<OverlayPresenter>(WithInvalidFieldsDefaulted(config),
                hardware,
                displaySource,
                isEditor,
                frameDuration,
                now);
        }
        if (!CVarShowOverlay.Get(true)) presenter->SetEnabled(false);
    }

    void OverlayThread::applyCVarChanges(float now) {
        if (CVarShowOverlay.Changed()) presenter->SetEnabled(CVarShowOverlay.Get(true));

        if (CVarFpsSampleCount.Changed() || CVarFpsUpdateDelay.Changed() || CVarColorCodeFps.Changed() ||
            CVarShowOnlyInEditor.Changed()) {
            presenter->Configure(ConfigFromCVars(true), now);
        }
    }

    void OverlayThread::Frame() {
        ZoneScoped;
        auto frameStart = chrono_clock::now();
        float frameDuration = std::chrono::duration<float>(frameStart - lastFrameTime).count();
        float now = SecondsSince(startTime, frameStart);
        lastFrameTime = frameStart;

        if (!presenter) {
            createPresenter(frameDuration, now);
        } else {
            applyCVarChanges(now);
        }
        presenter->Tick(frameDuration, now);
        frameCount++;

        std::lock_guard lock(snapshotMutex);
        textSnapshot = presenter->Text();
        visibleSnapshot = presenter->IsEnabled();
    }

    string OverlayThread::GetText() {
        std::lock_guard lock(snapshotMutex);
        return textSnapshot;
    }

    bool OverlayThread::IsVisible() {
        std::lock_guard lock(snapshotMutex);
        return visibleSnapshot;
    }
} // namespace hud
