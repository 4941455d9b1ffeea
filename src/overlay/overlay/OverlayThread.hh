/*
 * InfoHud - Copyright (C) 2025 Jacob Wirth & Justin Li
 *
 * This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#pragma once

#include "common/Logging.hh"
#include "common/RegisteredThread.hh"
#include "console/CVar.hh"
#include "overlay/OverlayPresenter.hh"

#include <mutex>

namespace hud {
    extern CVar<bool> CVarShowOverlay;
    extern CVar<int> CVarFpsSampleCount;
    extern CVar<float> CVarFpsUpdateDelay;
    extern CVar<bool> CVarColorCodeFps;
    extern CVar<bool> CVarShowOnlyInEditor;

    // Reads the hud.* console variables, clearing their Changed() flags if setClean is true.
    OverlayConfig ConfigFromCVars(bool setClean = false);

    class OverlayThread final : public RegisteredThread {
        LogOnExit logOnExit = "Overlay shut down =====================================================";

    public:
        OverlayThread(const HardwareInfo &hardware, DisplaySettingsSource &displaySource, bool isEditor, double tickRate);
        ~OverlayThread();

        void Start(bool startPaused = false) {
            StartThread(startPaused);
        }

        void Stop() {
            StopThread();
        }

        // Snapshot of the latest overlay text, safe to call from any thread.
        string GetText();
        bool IsVisible();
        uint64_t FrameCount() const {
            return frameCount;
        }

    protected:
        bool ThreadInit() override;
        void Frame() override;

    private:
        void createPresenter(float frameDuration, float now);
        void applyCVarChanges(float now);

        HardwareInfo hardware;
        DisplaySettingsSource &displaySource;
        const bool isEditor;

        chrono_clock::time_point startTime, lastFrameTime;
        unique_ptr<OverlayPresenter> presenter;
        std::atomic_uint64_t frameCount = 0;

        std::mutex snapshotMutex;
        string textSnapshot;
        bool visibleSnapshot = false;
    };
} // namespace hud
