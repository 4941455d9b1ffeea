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

namespace hud {
    enum class GraphicsApi : uint8_t {
        Null = 0,
        OpenGL,
        OpenGLES,
        Vulkan,
        Direct3D11,
        Direct3D12,
        Metal,
    };

    // Parses a case-insensitive api name, returns GraphicsApi::Null if it is not recognized.
    GraphicsApi ParseGraphicsApi(const string &name);

    struct GraphicsDeviceInfo {
        GraphicsApi api = GraphicsApi::Null;
        string deviceName = "None";
        int memoryMb = 0;
    };

    extern CVar<string> CVarGraphicsApi;
    extern CVar<string> CVarGpuName;
    extern CVar<int> CVarGpuMemory;

    // The renderer is an external collaborator, it reports its device through r.GraphicsApi, r.GpuName and r.GpuMemory.
    GraphicsDeviceInfo GraphicsDeviceFromCVars();

    // Static information about the application and the machine it runs on, captured once at startup.
    struct HardwareInfo {
        string version;
        GraphicsApi graphicsApi = GraphicsApi::Null;
        string operatingSystem;
        string processor;
        int systemMemoryMb = 0;
        string graphicsDevice;
        int graphicsMemoryMb = 0;
    };

    class SystemInfoSource {
    public:
        virtual ~SystemInfoSource() {}

        virtual HardwareInfo QueryHardwareInfo() = 0;
    };

    /*
     * Reads OS, CPU and memory details from the running machine.
     * Graphics details are owned by the renderer and handed in by the host.
     */
    class HostSystemInfo final : public SystemInfoSource {
    public:
        HostSystemInfo(string appVersion, GraphicsDeviceInfo graphics)
            : appVersion(std::move(appVersion)), graphics(std::move(graphics)) {}

        HardwareInfo QueryHardwareInfo() override;

    private:
        string appVersion;
        GraphicsDeviceInfo graphics;
    };

    string FormatHardwareInfo(const HardwareInfo &info);
} // namespace hud
