/*
 * InfoHud - Copyright (C) 2025 Jacob Wirth & Justin Li
 *
 * This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#pragma once

#include "common/Common.hh"

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <magic_enum.hpp>
#include <memory>
#include <string>
#include <type_traits>

namespace hud::logging {
    template<typename... T>
    static void Trace(const char *, int, const std::string &, T...);
    template<typename... T>
    static void Debug(const char *, int, const std::string &, T...);
    template<typename... T>
    static void Log(const char *, int, const std::string &, T...);
    template<typename... T>
    static void Warn(const char *, int, const std::string &, T...);
    template<typename... T>
    static void Error(const char *, int, const std::string &, T...);
    template<typename... T>
    [[noreturn]] static void Abort(const char *, int, const std::string &, T...);
} // namespace hud::logging

#define Tracef(...) ::hud::logging::Trace(__FILE__, __LINE__, __VA_ARGS__)
#define Debugf(...) ::hud::logging::Debug(__FILE__, __LINE__, __VA_ARGS__)
#define Logf(...) ::hud::logging::Log(__FILE__, __LINE__, __VA_ARGS__)
#define Warnf(...) ::hud::logging::Warn(__FILE__, __LINE__, __VA_ARGS__)
#define Errorf(...) ::hud::logging::Error(__FILE__, __LINE__, __VA_ARGS__)
#define Abortf(...) ::hud::logging::Abort(__FILE__, __LINE__, __VA_ARGS__)
#define Assertf(condition, ...) \
    if (!(condition)) ::hud::logging::Abort(__FILE__, __LINE__, __VA_ARGS__)
#define Assert(condition, message) \
    if (!(condition)) Abortf("assertion failed: %s", message)

#ifdef HUD_DEBUG
    #define DebugAssert(condition, message) Assert(condition, message)
    #define DebugAssertf(condition, ...) Assertf(condition, __VA_ARGS__)
#else
    #define DebugAssert(condition, message)
    #define DebugAssertf(condition, ...)
#endif

namespace hud::logging {
    enum class Level : uint8_t { Error, Warn, Log, Debug, Trace };

    // time in seconds
    float LogTime();
    Level GetLogLevel();
    void SetLogLevel(Level level);
    // Empty if log output is not mirrored to a file
    string GetLogOutputFile();
    void SetLogOutputFile(const char *filePath);

    // Defined in console/Console.cc
    void GlobalLogOutput(Level level, const string &message);

    inline static const char *basename(const char *file) {
        const char *r;
        if ((r = strrchr(file, '/'))) return r + 1;
        if ((r = strrchr(file, '\\'))) return r + 1;
        return file;
    }

    // Convert all std::strings to const char* using constexpr if (C++17)
    // Source: https://gist.github.com/Zitrax/a2e0040d301bf4b8ef8101c0b1e3f1d5
    // Modified to support string_view and enums via magic_enum.hpp
    template<typename T>
    auto convert(T &&t) {
        using BaseType = std::remove_cv_t<std::remove_reference_t<T>>;

        if constexpr (std::is_same<BaseType, std::string>()) {
            return std::forward<T>(t).c_str();
        } else if constexpr (std::is_same<BaseType, std::string_view>()) {
            if (t.empty()) return "";
            Assert(t.data()[t.size()] == '\0', "string_view is not null terminated");
            return std::forward<T>(t).data();
        } else if constexpr (std::is_enum_v<BaseType>) {
            if (magic_enum::enum_name(std::forward<T>(t)).empty()) return "invalid_enum";
            return magic_enum::enum_name(std::forward<T>(t)).data();
        } else {
            return std::forward<T>(t);
        }
    }

    template<typename... T>
    inline static void writeFormatter(Level lvl, std::string fmt, T &&...t) {
        if (lvl > GetLogLevel()) return;
        int size = std::snprintf(nullptr, 0, fmt.c_str(), std::forward<T>(t)...);
        if (size < 0) return;
        // snprintf writes N + 1 bytes with null terminator
        std::string buf(size + 1, '\0');
        std::snprintf(buf.data(), size + 1, fmt.c_str(), std::forward<T>(t)...);
        buf.resize(size); // Remove unnecessary null terminator
        GlobalLogOutput(lvl, buf);
    }

    template<typename... Tn>
    inline static void writeLog(Level lvl, const char *file, int line, const std::string &fmt, Tn &&...tn) {
#ifdef HUD_VERBOSE_LOGGING
        writeFormatter(lvl,
            "%.3f " + fmt + "  (%s:%d)\n",
            LogTime(),
            convert(std::forward<Tn>(tn))...,
            basename(file),
            line);
#else
        writeFormatter(lvl, "%.3f " + fmt + "\n", LogTime(), convert(std::forward<Tn>(tn))...);
#endif
    }

    template<typename... T>
    static void ConsoleWrite(Level lvl, const std::string &fmt, T... t) {
        writeFormatter(lvl, fmt + "\n", convert(std::forward<T>(t))...);
    }

    template<typename... T>
    static void Trace(const char *file, int line, const std::string &fmt, T... t) {
        writeLog(Level::Trace, file, line, "[trace] " + fmt, t...);
    }

    template<typename... T>
    static void Debug(const char *file, int line, const std::string &fmt, T... t) {
        writeLog(Level::Debug, file, line, "[dbg] " + fmt, t...);
    }

    template<typename... T>
    static void Log(const char *file, int line, const std::string &fmt, T... t) {
        writeLog(Level::Log, file, line, "[log] " + fmt, t...);
    }

    template<typename... T>
    static void Warn(const char *file, int line, const std::string &fmt, T... t) {
        writeLog(Level::Warn, file, line, "[warn] " + fmt, t...);
    }

    template<typename... T>
    static void Error(const char *file, int line, const std::string &fmt, T... t) {
        writeLog(Level::Error, file, line, "[error] " + fmt, t...);
    }

    template<typename... T>
    [[noreturn]] static void Abort(const char *file, int line, const std::string &fmt, T... t) {
        writeLog(Level::Error, file, line, "[abort] " + fmt, t...);
        hud::Abort();
    }
} // namespace hud::logging

namespace hud {
    struct LogOnExit {
        const char *message;
        LogOnExit(const char *message) : message(message) {}
        ~LogOnExit() {
            if (logging::Level::Debug > logging::GetLogLevel()) return;
            std::cout << std::fixed << std::setprecision(3) << logging::LogTime() << " [debug] " << message << std::endl
                      << std::flush;
        }
    };
} // namespace hud
