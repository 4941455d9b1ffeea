/*
 * InfoHud - Copyright (C) 2025 Jacob Wirth & Justin Li
 *
 * This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#pragma once

#include "common/Common.hh"
#include "common/StreamOverloads.hh"

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace hud {
    class CVarBase : public NonCopyable {
    public:
        CVarBase(const std::string &name, const std::string &description);
        virtual ~CVarBase();

        const std::string &GetName() const {
            return name;
        }

        const std::string &GetNameLower() const {
            return nameLower;
        }

        const std::string &GetDescription() const {
            return description;
        }

        virtual std::string StringValue() = 0;
        // Returns false if the string could not be parsed, the previous value is kept.
        virtual bool SetFromString(const std::string &newValue) = 0;

        bool Changed() const {
            return dirty;
        }

    protected:
        std::atomic_bool dirty = true;

    private:
        std::string name, nameLower, description;
    };

    /*
     * A named value that can be changed at runtime from the console, the command line or a config script.
     * Reads and writes of the value are guarded by a mutex so that the console and frame threads can share it.
     */
    template<typename VarType>
    class CVar : public CVarBase {
    public:
        CVar(const std::string &name, const VarType &initial, const std::string &description)
            : CVarBase(name, description), value(initial) {}

        inline VarType Get() const {
            std::lock_guard lock(valueMutex);
            return value;
        }

        // Reads the value and optionally clears the Changed() flag.
        inline VarType Get(bool setClean) {
            std::lock_guard lock(valueMutex);
            if (setClean) dirty = false;
            return value;
        }

        void Set(const VarType &newValue) {
            std::lock_guard lock(valueMutex);
            value = newValue;
            dirty = true;
        }

        std::string StringValue() override {
            std::stringstream out;
            std::lock_guard lock(valueMutex);
            out << value;
            return out.str();
        }

        bool SetFromString(const std::string &newValue) override {
            if (newValue.size() == 0) return true;

            std::stringstream in(newValue);
            VarType parsed = Get();
            in >> parsed;
            if (in.fail()) return false;

            Set(parsed);
            return true;
        }

    private:
        mutable std::mutex valueMutex;
        VarType value;
    };

    template<>
    inline bool CVar<std::string>::SetFromString(const std::string &newValue) {
        Set(newValue);
        return true;
    }
} // namespace hud
