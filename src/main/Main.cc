/*
 * InfoHud - Copyright (C) 2025 Jacob Wirth & Justin Li
 *
 * This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "common/Common.hh"
#include "common/Logging.hh"
#include "console/Console.hh"
#include "overlay/DisplaySettings.hh"
#include "overlay/OverlayThread.hh"
#include "overlay/SystemInfo.hh"

#include <atomic>
#include <csignal>
#include <cxxopts.hpp>
#include <filesystem>
#include <iostream>
#include <thread>

#ifndef HUD_VERSION
    #define HUD_VERSION "0.0.0"
#endif

using cxxopts::value;

namespace hud {
    std::atomic_flag ExitTriggered;

    void handleSignals(int signal) {
        if (signal == SIGINT) {
            ExitTriggered.test_and_set();
            ExitTriggered.notify_all();
        }
    }

    static void printOverlay(const string &text) {
        for (auto &line : split(text, "<br>")) {
            Logf("%s", line);
        }
    }
} // namespace hud

int main(int argc, char **argv) {
#ifdef _WIN32
    signal(SIGINT, hud::handleSignals);
#else
    struct sigaction act;
    act.sa_handler = hud::handleSignals;
    sigemptyset(&act.sa_mask);
    act.sa_flags = 0;
    sigaction(SIGINT, &act, 0);
#endif

    cxxopts::Options options("infohud", "System info and frame rate overlay\n");

    // clang-format off
    options.add_options()
        ("h,help", "Display help")
        ("v,verbose", "Enable debug logging")
        ("config", "Console script to run at startup", value<string>())
        ("cvar", "Set cvar to initial value", value<vector<string>>())
        ("tick-rate", "Overlay frames per second", value<double>()->default_value("60"))
        ("time", "Exit after this many seconds (default: run until interrupted)", value<double>())
        ("print-interval", "Seconds between printing the overlay text", value<double>()->default_value("1"))
        ("editor", "Run as an editor build")
        ("log-file", "Also write log output to this file", value<string>());
    // clang-format on

    try {
        auto optionsResult = options.parse(argc, argv);

        if (optionsResult.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        if (optionsResult.count("verbose")) hud::logging::SetLogLevel(hud::logging::Level::Debug);
        if (optionsResult.count("log-file")) {
            hud::logging::SetLogOutputFile(optionsResult["log-file"].as<string>().c_str());
        }

        Logf("InfoHud %s starting in directory: %s", HUD_VERSION, std::filesystem::current_path().string());

        auto &console = hud::GetConsoleManager();
        if (optionsResult.count("config")) {
            if (!console.ExecuteScript(optionsResult["config"].as<string>())) return 1;
        }
        if (optionsResult.count("cvar")) {
            for (auto &cvarline : optionsResult["cvar"].as<vector<string>>()) {
                console.ParseAndExecute(cvarline);
            }
        }

        double tickRate = optionsResult["tick-rate"].as<double>();
        if (tickRate <= 0.0) {
            Errorf("Tick rate must be positive: %f", tickRate);
            return 1;
        }
        auto printInterval = std::chrono::duration<double>(optionsResult["print-interval"].as<double>());
        if (printInterval.count() <= 0.0) {
            Errorf("Print interval must be positive: %f", printInterval.count());
            return 1;
        }
        std::optional<chrono_clock::time_point> exitTime;
        if (optionsResult.count("time")) {
            exitTime = chrono_clock::now() + std::chrono::duration_cast<chrono_clock::duration>(
                                                 std::chrono::duration<double>(optionsResult["time"].as<double>()));
        }

        hud::HostSystemInfo systemInfo(HUD_VERSION, hud::GraphicsDeviceFromCVars());
        auto hardware = systemInfo.QueryHardwareInfo();

        hud::CVarDisplaySettings displaySettings;
        hud::OverlayThread overlay(hardware, displaySettings, optionsResult.count("editor") > 0, tickRate);
        overlay.Start();

        auto nextPrint = chrono_clock::now() + std::chrono::duration_cast<chrono_clock::duration>(printInterval);
        while (!hud::ExitTriggered.test()) {
            auto wakeTime = nextPrint;
            if (exitTime && *exitTime < wakeTime) wakeTime = *exitTime;
            std::this_thread::sleep_until(wakeTime);

            auto now = chrono_clock::now();
            if (now >= nextPrint) {
                if (overlay.IsVisible()) hud::printOverlay(overlay.GetText());
                nextPrint += std::chrono::duration_cast<chrono_clock::duration>(printInterval);
                if (nextPrint < now) nextPrint = now;
            }
            if (exitTime && now >= *exitTime) break;
        }

        overlay.Stop();
        Logf("Overlay ran %llu frames, last measured at %u fps", (unsigned long long)overlay.FrameCount(),
            overlay.GetMeasuredFps());
        return 0;
    } catch (const std::exception &ex) {
        Errorf("terminating with exception: %s", ex.what());
    }
    return 1;
}
