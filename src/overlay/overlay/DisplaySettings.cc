/*
 * InfoHud - Copyright (C) 2025 Jacob Wirth & Justin Li
 *
 * This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "DisplaySettings.hh"

#include "common/Logging.hh"
#include "overlay/AspectRatio.hh"

#include <magic_enum.hpp>

namespace hud {
    CVar<glm::ivec2> CVarWindowSize("r.Size", {1920, 1080}, "Window size in pixels");
    CVar<glm::ivec2> CVarMonitorSize("r.MonitorSize", {1920, 1080}, "Resolution of the monitor showing the window");
    CVar<int> CVarWindowMode("r.WindowMode",
        3,
        "Window mode (0: exclusive fullscreen, 1: fullscreen window, 2: maximized window, 3: windowed)");
    CVar<int> CVarVSync("r.VSync", 1, "Number of vertical blanks to wait between frames (0: vsync off)");
    CVar<int> CVarQualityLevel("r.QualityLevel", 3, "Index of the active graphics quality level");

    const vector<string> DefaultQualityLevelNames = {"Very Low", "Low", "Medium", "High", "Very High", "Ultra"};

    DisplaySettings CVarDisplaySettings::Current() {
        DisplaySettings settings;
        settings.windowSize = CVarWindowSize.Get();
        settings.monitorResolution = CVarMonitorSize.Get();
        settings.vsyncCount = CVarVSync.Get();
        settings.qualityLevel = CVarQualityLevel.Get();
        settings.qualityLevelNames = qualityLevelNames;

        bool modeChanged = CVarWindowMode.Changed();
        auto modeIndex = CVarWindowMode.Get(true);
        auto mode = magic_enum::enum_cast<WindowMode>(modeIndex);
        if (mode) {
            settings.windowMode = *mode;
        } else {
            if (modeChanged) Warnf("Invalid r.WindowMode %d, showing as windowed", modeIndex);
            settings.windowMode = WindowMode::Windowed;
        }
        return settings;
    }

    string FormatResolution(const DisplaySettings &settings) {
        return "<b>Resolution:</b> " + std::to_string(settings.windowSize.x) + "x" +
               std::to_string(settings.windowSize.y) + " (" + AspectRatioString(settings.monitorResolution) + ")";
    }

    string FormatWindowMode(WindowMode mode) {
        string text = "<b>Window Mode:</b> ";
        if (mode == WindowMode::ExclusiveFullScreen) {
            text += "FullScreen";
        } else if (mode == WindowMode::FullScreenWindow) {
            text += "Windowed FullScreen";
        } else {
            text += "Windowed";
        }
        return text;
    }

    string FormatVSync(int vsyncCount) {
        return "<b>VSync:</b> "s + (vsyncCount > 0 ? "On" : "Off");
    }

    string FormatQualityLevel(const DisplaySettings &settings) {
        const auto &names = settings.qualityLevelNames;
        if (settings.qualityLevel < 0 || (size_t)settings.qualityLevel >= names.size()) {
            return "<b>Quality Level:</b> Unknown";
        }
        return "<b>Quality Level:</b> " + names[settings.qualityLevel];
    }
} // namespace hud
