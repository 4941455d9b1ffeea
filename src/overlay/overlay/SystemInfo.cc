/*
 * InfoHud - Copyright (C) 2025 Jacob Wirth & Justin Li
 *
 * This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "SystemInfo.hh"

#include "common/Logging.hh"
#include "common/Tracing.hh"

#include <fstream>
#include <magic_enum.hpp>
#include <thread>

#ifndef _WIN32
    #include <sys/utsname.h>
    #include <unistd.h>
#endif

namespace hud {
    CVar<string> CVarGraphicsApi("r.GraphicsApi", "Null", "Graphics api used by the renderer");
    CVar<string> CVarGpuName("r.GpuName", "None", "Name of the graphics device used by the renderer");
    CVar<int> CVarGpuMemory("r.GpuMemory", 0, "Memory of the graphics device in MB");

    GraphicsApi ParseGraphicsApi(const string &name) {
        auto api = magic_enum::enum_cast<GraphicsApi>(name, magic_enum::case_insensitive);
        if (!api) {
            Warnf("Unknown graphics api: %s", name);
            return GraphicsApi::Null;
        }
        return *api;
    }

    GraphicsDeviceInfo GraphicsDeviceFromCVars() {
        GraphicsDeviceInfo graphics;
        graphics.api = ParseGraphicsApi(CVarGraphicsApi.Get());
        graphics.deviceName = CVarGpuName.Get();
        graphics.memoryMb = CVarGpuMemory.Get();
        return graphics;
    }

    static string queryOperatingSystem() {
#ifndef _WIN32
        struct utsname names;
        if (uname(&names) == 0) {
            return string(names.sysname) + " " + names.release + " " + names.machine;
        }
        Warnf("uname() failed, operating system unknown");
#endif
        return "Unknown";
    }

    static string queryProcessor() {
        string model;
#ifdef __linux__
        std::ifstream cpuinfo("/proc/cpuinfo");
        string line;
        while (std::getline(cpuinfo, line)) {
            if (!starts_with(line, "model name")) continue;
            auto colon = line.find(':');
            if (colon == string::npos) continue;
            model = line.substr(colon + 1);
            trim(model);
            break;
        }
#endif
        if (model.empty()) model = "Unknown";

        auto threads = std::thread::hardware_concurrency();
        if (threads > 0) model += " (" + std::to_string(threads) + " threads)";
        return model;
    }

    static int querySystemMemoryMb() {
#ifndef _WIN32
        long pages = sysconf(_SC_PHYS_PAGES);
        long pageSize = sysconf(_SC_PAGE_SIZE);
        if (pages > 0 && pageSize > 0) {
            return (int)(((int64_t)pages * (int64_t)pageSize) / (1024 * 1024));
        }
        Warnf("sysconf() failed, system memory unknown");
#endif
        return 0;
    }

    HardwareInfo HostSystemInfo::QueryHardwareInfo() {
        ZoneScoped;
        HardwareInfo info;
        info.version = appVersion;
        info.graphicsApi = graphics.api;
        info.operatingSystem = queryOperatingSystem();
        info.processor = queryProcessor();
        info.systemMemoryMb = querySystemMemoryMb();
        info.graphicsDevice = graphics.deviceName;
        info.graphicsMemoryMb = graphics.memoryMb;

        Debugf("Hardware info: %s, %s, %dMB RAM, %s %s",
            info.operatingSystem,
            info.processor,
            info.systemMemoryMb,
            info.graphicsApi,
            info.graphicsDevice);
        return info;
    }

    string FormatHardwareInfo(const HardwareInfo &info) {
        return "<b>Version:</b> " + info.version + "<br>" +
               "<b>API:</b> " + string(magic_enum::enum_name(info.graphicsApi)) + "<br>" +
               "<b>OS:</b> " + info.operatingSystem + "<br>" +
               "<b>CPU:</b> " + info.processor + "<br>" +
               "<b>RAM:</b> " + std::to_string(info.systemMemoryMb) + "MB<br>" +
               "<b>GPU:</b> " + info.graphicsDevice + "<br>" +
               "<b>VRAM:</b> " + std::to_string(info.graphicsMemoryMb) + "MB";
    }
} // namespace hud
