/*
 * InfoHud - Copyright (C) 2025 Jacob Wirth & Justin Li
 *
 * This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#pragma once

#include "common/Common.hh"
#include "common/Logging.hh"
#include "console/CVar.hh"

#include <fstream>
#include <map>
#include <mutex>

namespace hud {
    struct ConsoleLine {
        logging::Level level;
        string text;
    };

    class ConsoleManager : public NonMoveable {
    public:
        static const size_t MaxOutputLines = 1000;

        void AddCVar(CVarBase *cvar);
        void RemoveCVar(CVarBase *cvar);

        // Returns nullptr if no cvar with this name exists.
        CVarBase *FindCVar(const string &name);

        template<typename T>
        CVar<T> &GetCVar(const string &name) {
            auto *base = FindCVar(name);
            Assertf(base, "CVar %s does not exist", name);
            auto *derived = dynamic_cast<CVar<T> *>(base);
            Assertf(derived, "CVar %s has unexpected type", name);
            return *derived;
        }

        void AddLog(logging::Level lvl, const string &line);

        const vector<ConsoleLine> Lines() {
            std::lock_guard lock(linesLock);
            return outputLines;
        }

        // Executes one or more ';' separated commands of the form "name value".
        void ParseAndExecute(const string &line);

        // Executes every line of a console script file. Blank lines and lines starting with '#' are skipped.
        bool ExecuteScript(const string &path);

    private:
        ConsoleManager() = default;

        void Execute(const string &cmd, const string &args);

        std::mutex cvarLock;
        std::map<string, CVarBase *> cvars;

        std::mutex linesLock;
        vector<ConsoleLine> outputLines;
        std::ofstream logFile;
        string logFilePath;

        friend ConsoleManager &GetConsoleManager();
    };

    ConsoleManager &GetConsoleManager();
} // namespace hud
