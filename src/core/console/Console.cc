/*
 * InfoHud - Copyright (C) 2025 Jacob Wirth & Justin Li
 *
 * This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "Console.hh"

#include "common/Logging.hh"
#include "common/Tracing.hh"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace hud {
    ConsoleManager &GetConsoleManager() {
        static ConsoleManager GConsoleManager;
        return GConsoleManager;
    }

    namespace logging {
        void GlobalLogOutput(Level lvl, const string &line) {
            std::cerr << line << std::flush;
            GetConsoleManager().AddLog(lvl, line);
        }
    } // namespace logging

    CVarBase::CVarBase(const string &name, const string &description)
        : name(name), nameLower(to_lower_copy(name)), description(description) {
        GetConsoleManager().AddCVar(this);
    }

    CVarBase::~CVarBase() {
        GetConsoleManager().RemoveCVar(this);
    }

    void ConsoleManager::AddCVar(CVarBase *cvar) {
        std::lock_guard lock(cvarLock);
        cvars[cvar->GetNameLower()] = cvar;
    }

    void ConsoleManager::RemoveCVar(CVarBase *cvar) {
        std::lock_guard lock(cvarLock);
        auto it = cvars.find(cvar->GetNameLower());
        if (it != cvars.end() && it->second == cvar) cvars.erase(it);
    }

    CVarBase *ConsoleManager::FindCVar(const string &name) {
        std::lock_guard lock(cvarLock);
        auto it = cvars.find(all_lower(name) ? name : to_lower_copy(name));
        if (it == cvars.end()) return nullptr;
        return it->second;
    }

    void ConsoleManager::AddLog(logging::Level lvl, const string &line) {
        std::lock_guard lock(linesLock);
        outputLines.push_back({lvl, line});
        if (outputLines.size() > MaxOutputLines) {
            outputLines.erase(outputLines.begin(), outputLines.begin() + (outputLines.size() - MaxOutputLines));
        }

        auto path = logging::GetLogOutputFile();
        if (path.empty()) {
            if (logFile.is_open()) logFile.close();
            logFilePath.clear();
            return;
        }
        if (logFilePath != path) {
            if (logFile.is_open()) logFile.close();
            logFilePath = path;
            logFile.open(logFilePath, std::ios::out | std::ios::app);
            if (!logFile) std::cerr << "Failed to open log file: " << logFilePath << std::endl;
        }
        if (logFile) logFile << line << std::flush;
    }

    void ConsoleManager::ParseAndExecute(const string &line) {
        if (line == "") return;

        auto cmd = line.begin();
        do {
            auto cmdEnd = std::find(cmd, line.end(), ';');

            std::stringstream stream(std::string(cmd, cmdEnd));
            string varName, value;
            stream >> varName;
            getline(stream, value);
            trim(value);
            if (!varName.empty()) Execute(varName, value);

            if (cmdEnd != line.end()) cmdEnd++;
            cmd = cmdEnd;
        } while (cmd != line.end());
    }

    bool ConsoleManager::ExecuteScript(const string &path) {
        ZoneScoped;
        std::ifstream file(path);
        if (!file) {
            Errorf("Console script not found: %s", path);
            return false;
        }

        Logf("Executing commands from file: %s", path);
        string line;
        while (std::getline(file, line)) {
            trim(line);
            if (line.empty() || line[0] == '#') continue;
            ParseAndExecute(line);
        }
        return true;
    }

    void ConsoleManager::Execute(const string &cmd, const string &args) {
        Tracef("Executing console command: %s %s", cmd, args);
        auto *cvar = FindCVar(cmd);
        if (!cvar) {
            logging::ConsoleWrite(logging::Level::Log, " > '%s' undefined", cmd);
            return;
        }

        if (!cvar->SetFromString(args)) {
            Errorf("Invalid value for %s: '%s'", cvar->GetName(), args);
            return;
        }

        logging::ConsoleWrite(logging::Level::Log, " > %s = %s", cvar->GetName(), cvar->StringValue());
        if (args.length() == 0) {
            logging::ConsoleWrite(logging::Level::Log, " >   %s", cvar->GetDescription());
        }
    }
} // namespace hud
