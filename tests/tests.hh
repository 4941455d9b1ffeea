/*
 * InfoHud - Copyright (C) 2025 Jacob Wirth & Justin Li
 *
 * This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

template<typename Ta, typename Tb>
inline std::ostream &operator<<(std::ostream &out, const std::pair<Ta, Tb> &v) {
    return out << "(" << v.first << ", " << v.second << ")";
}

namespace testing {
    extern std::vector<std::function<void()>> registeredTests;

    class Test {
    public:
        Test(std::function<void()> testFunc) {
            registeredTests.emplace_back(testFunc);
        }
    };

    static inline void AssertTrue(bool condition, const std::string &message) {
        if (!condition) {
            std::stringstream ss;
            ss << "Assertion failed: " << message << std::endl;
            std::cerr << ss.str() << std::flush;
            throw std::runtime_error(message);
        }
    }

    template<typename>
    struct is_optional : std::false_type {};

    template<typename T>
    struct is_optional<std::optional<T>> : std::true_type {};

    template<typename Ta, typename Tb>
    inline void AssertEqual(Ta a, Tb b, const std::string &message = "not equal") {
        if (!(a == b)) {
            std::stringstream ss;
            ss << "Assertion failed: " << message << " \"";
            if constexpr (is_optional<Ta>()) {
                if (a.has_value()) {
                    ss << *a;
                } else {
                    ss << "none";
                }
            } else {
                ss << a;
            }
            ss << "\" != \"";
            if constexpr (is_optional<Tb>()) {
                if (b.has_value()) {
                    ss << *b;
                } else {
                    ss << "none";
                }
            } else {
                ss << b;
            }
            ss << "\"" << std::endl;
            std::cerr << ss.str() << std::flush;
            throw std::runtime_error(message);
        }
    }

    inline bool FloatEqual(float a, float b) {
        constexpr float feps = 0.0000015;
        return (a - feps < b) && (a + feps > b);
    }

    template<>
    inline void AssertEqual<float, float>(float a, float b, const std::string &message) {
        if (!FloatEqual(a, b)) {
            std::stringstream ss;
            ss << "Assertion failed: " << message << " (" << a << " != " << b << ")" << std::endl;
            std::cerr << ss.str() << std::flush;
            throw std::runtime_error(message);
        }
    }

    // For values that went through a chain of float operations, compared with an explicit tolerance.
    inline void AssertNear(double a, double b, double epsilon, const std::string &message) {
        if (!(std::abs(a - b) <= epsilon)) {
            std::stringstream ss;
            ss << "Assertion failed: " << message << " (" << a << " != " << b << " +- " << epsilon << ")"
               << std::endl;
            std::cerr << ss.str() << std::flush;
            throw std::runtime_error(message);
        }
    }

    inline void AssertContains(const std::string &haystack, const std::string &needle, const std::string &message) {
        if (haystack.find(needle) == std::string::npos) {
            std::stringstream ss;
            ss << "Assertion failed: " << message << " (\"" << haystack << "\" does not contain \"" << needle
               << "\")" << std::endl;
            std::cerr << ss.str() << std::flush;
            throw std::runtime_error(message);
        }
    }

    template<typename Exception, typename Fn>
    inline void AssertThrows(Fn &&fn, const std::string &message) {
        try {
            fn();
        } catch (const Exception &) {
            return;
        }
        std::stringstream ss;
        ss << "Assertion failed: " << message << " (nothing thrown)" << std::endl;
        std::cerr << ss.str() << std::flush;
        throw std::runtime_error(message);
    }

    class Timer {
    public:
        Timer(const Timer &) = delete;

        Timer(std::string name) : name(name) {
            std::stringstream ss;
            ss << "[" << name << "] Start" << std::endl;
            std::cout << ss.str();
            start = std::chrono::high_resolution_clock::now();
        }

        ~Timer() {
            auto end = std::chrono::high_resolution_clock::now();
            std::stringstream ss;
            ss << "[" << name << "] End: " << ((end - start).count() / 1000000.0) << " ms" << std::endl;
            std::cout << ss.str();
        }

    private:
        std::string name;
        std::chrono::high_resolution_clock::time_point start;
    };
} // namespace testing
