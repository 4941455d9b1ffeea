/*
 * InfoHud - Copyright (C) 2025 Jacob Wirth & Justin Li
 *
 * This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "Common.hh"

#include "common/Logging.hh"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

#if defined(HUD_DEBUG) && !defined(_WIN32) && !defined(__arm__) && !defined(__aarch64__)
    #define os_break() asm("int $3")
#elif defined(HUD_DEBUG) && defined(_WIN32)
    #include <intrin.h>
    #define os_break() __debugbreak()
#else
    #define os_break()
#endif

namespace hud {
    [[noreturn]] void Abort() {
        std::cerr << std::flush;
        os_break();
        throw std::runtime_error("hud::Abort() called");
    }

    bool all_lower(const string &str) {
        return std::all_of(str.begin(), str.end(), [](unsigned char c) {
            return !std::isupper(c);
        });
    }

    namespace boost_replacements {
        bool starts_with(const string_view &str, const string_view &prefix) {
            return str.rfind(prefix, 0) == 0;
        }

        string to_lower_copy(const string &str) {
            string out(str);
            std::transform(str.begin(), str.end(), out.begin(), [](unsigned char ch) {
                return std::tolower(ch);
            });
            return out;
        }

        void trim(string &str) {
            trim_right(str);
            trim_left(str);
        }

        void trim_left(string &str) {
            auto left = std::find_if(str.begin(), str.end(), [](unsigned char ch) {
                return !std::isspace(ch);
            });
            str.erase(str.begin(), left);
        }

        void trim_right(string &str) {
            auto right = std::find_if(str.rbegin(), str.rend(), [](unsigned char ch) {
                return !std::isspace(ch);
            }).base();
            str.erase(right, str.end());
        }

        vector<string> split(const string &str, const string &delimiter) {
            vector<string> parts;
            if (delimiter.empty()) {
                parts.emplace_back(str);
                return parts;
            }
            size_t start = 0, end;
            while ((end = str.find(delimiter, start)) != string::npos) {
                parts.emplace_back(str.substr(start, end - start));
                start = end + delimiter.size();
            }
            parts.emplace_back(str.substr(start));
            return parts;
        }
    } // namespace boost_replacements
} // namespace hud
