/*
 * InfoHud - Copyright (C) 2025 Jacob Wirth & Justin Li
 *
 * This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#pragma once

#include <memory>
using std::make_shared;
using std::make_unique;
using std::shared_ptr;
using std::unique_ptr;

#include <vector>
using std::vector;

#include <string>
#include <string_view>
using std::string;
using std::string_view;
using namespace std::string_literals;

#include <chrono>
typedef std::chrono::steady_clock chrono_clock;

#include <glm/glm.hpp>
#include <optional>

namespace hud {
    [[noreturn]] void Abort();

    class NonCopyable {
    public:
        NonCopyable() = default;
        NonCopyable(const NonCopyable &) = delete;
        NonCopyable &operator=(const NonCopyable &) = delete;
    };

    class NonMoveable : public NonCopyable {
    public:
        NonMoveable() = default;
        NonMoveable(NonMoveable &&) = delete;
        NonMoveable &operator=(NonMoveable &&) = delete;
    };

    bool all_lower(const string &str);

    namespace boost_replacements {
        bool starts_with(const string_view &str, const string_view &prefix);
        string to_lower_copy(const string &str);
        void trim(string &str);
        void trim_left(string &str);
        void trim_right(string &str);
        vector<string> split(const string &str, const string &delimiter);
    } // namespace boost_replacements
    using namespace boost_replacements;

    // Seconds elapsed since `start`, suitable for feeding per-tick timing code.
    inline float SecondsSince(chrono_clock::time_point start, chrono_clock::time_point now = chrono_clock::now()) {
        return std::chrono::duration<float>(now - start).count();
    }
} // namespace hud
