/*
 * InfoHud - Copyright (C) 2025 Jacob Wirth & Justin Li
 *
 * This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "AspectRatio.hh"

namespace hud {
    uint32_t GreatestCommonDivisor(uint32_t a, uint32_t b) {
        while (a != 0 && b != 0) {
            if (a > b) {
                a %= b;
            } else {
                b %= a;
            }
        }
        return a | b;
    }

    static uint32_t magnitude(int value) {
        return value < 0 ? 0u - (uint32_t)value : (uint32_t)value;
    }

    AspectRatio ReduceAspectRatio(int width, int height) {
        uint32_t gcd = GreatestCommonDivisor(magnitude(width), magnitude(height));
        if (gcd == 0) return AspectRatio{0, 0};

        return AspectRatio{(int)((int64_t)width / (int64_t)gcd), (int)((int64_t)height / (int64_t)gcd)};
    }

    string AspectRatioString(int width, int height) {
        auto ratio = ReduceAspectRatio(width, height);
        if (!ratio.Valid()) return "N/A";
        return std::to_string(ratio.width) + ":" + std::to_string(ratio.height);
    }
} // namespace hud
