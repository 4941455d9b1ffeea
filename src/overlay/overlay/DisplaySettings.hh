/*
 * InfoHud - Copyright (C) 2025 Jacob Wirth & Justin Li
 *
 * This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#pragma once

#include "common/Common.hh"
#include "console/CVar.hh"

#include <cstdint>
#include <glm/glm.hpp>

namespace hud {
    enum class WindowMode : uint8_t {
        ExclusiveFullScreen = 0,
        FullScreenWindow,
        MaximizedWindow,
        Windowed,
    };

    extern CVar<glm::ivec2> CVarWindowSize;
    extern CVar<glm::ivec2> CVarMonitorSize;
    extern CVar<int> CVarWindowMode;
    extern CVar<int> CVarVSync;
    extern CVar<int> CVarQualityLevel;

    extern const vector<string> DefaultQualityLevelNames;

    // Display settings that may change from one frame to the next.
    struct DisplaySettings {
        glm::ivec2 windowSize = {0, 0};
        glm::ivec2 monitorResolution = {0, 0};
        WindowMode windowMode = WindowMode::Windowed;
        int vsyncCount = 0;
        int qualityLevel = 0;
        vector<string> qualityLevelNames;
    };

    class DisplaySettingsSource {
    public:
        virtual ~DisplaySettingsSource() {}

        virtual DisplaySettings Current() = 0;
    };

    // Reads the display settings from the r.* console variables.
    class CVarDisplaySettings final : public DisplaySettingsSource {
    public:
        CVarDisplaySettings(vector<string> qualityLevelNames = DefaultQualityLevelNames)
            : qualityLevelNames(std::move(qualityLevelNames)) {}

        DisplaySettings Current() override;

    private:
        vector<string> qualityLevelNames;
    };

    string FormatResolution(const DisplaySettings &settings);
    string FormatWindowMode(WindowMode mode);
    string FormatVSync(int vsyncCount);
    string FormatQualityLevel(const DisplaySettings &settings);
} // namespace hud
