/*
 * InfoHud - Copyright (C) 2025 Jacob Wirth & Justin Li
 *
 * This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#pragma once

#include "common/Common.hh"

#include <cstdint>
#include <glm/glm.hpp>

namespace hud {
    struct AspectRatio {
        int width = 0;
        int height = 0;

        // A 0x0 input has no ratio and reduces to {0, 0}
        bool Valid() const {
            return width != 0 || height != 0;
        }

        bool operator==(const AspectRatio &other) const {
            return width == other.width && height == other.height;
        }

        bool operator!=(const AspectRatio &other) const {
            return !(*this == other);
        }
    };

    /*
     * Euclid's algorithm by remainder: the larger operand is replaced by its remainder modulo the smaller one
     * until one of them reaches zero, at which point the other one holds the result.
     * GreatestCommonDivisor(0, 0) == 0.
     */
    uint32_t GreatestCommonDivisor(uint32_t a, uint32_t b);

    // Reduces width:height to lowest terms. Negative inputs are reduced by magnitude and keep their sign.
    AspectRatio ReduceAspectRatio(int width, int height);

    inline AspectRatio ReduceAspectRatio(const glm::ivec2 &resolution) {
        return ReduceAspectRatio(resolution.x, resolution.y);
    }

    // Formats the reduced ratio as "W:H", or "N/A" for a 0x0 resolution.
    string AspectRatioString(int width, int height);

    inline string AspectRatioString(const glm::ivec2 &resolution) {
        return AspectRatioString(resolution.x, resolution.y);
    }
} // namespace hud
