/*
 * InfoHud - Copyright (C) 2025 Jacob Wirth & Justin Li
 *
 * This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "Logging.hh"

#include <atomic>
#include <mutex>

namespace hud::logging {
    static std::atomic<Level> logLevel = Level::Log;
    static chrono_clock::time_point LogEpoch = chrono_clock::now();

    static std::mutex logFileMutex;
    static string logFilePath;

    float LogTime() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(chrono_clock::now() - LogEpoch).count() / 1000.0f;
    }

    Level GetLogLevel() {
        return logLevel;
    }

    void SetLogLevel(Level level) {
        logLevel = level;
    }

    string GetLogOutputFile() {
        std::lock_guard lock(logFileMutex);
        return logFilePath;
    }

    void SetLogOutputFile(const char *filePath) {
        std::lock_guard lock(logFileMutex);
        logFilePath = filePath ? filePath : "";
    }

    // GlobalLogOutput defined in console/Console.cc
} // namespace hud::logging
