/*
 * InfoHud - Copyright (C) 2025 Jacob Wirth & Justin Li
 *
 * This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#pragma once

#include "common/Logging.hh"

#include <cstring>
#include <tracy/Tracy.hpp>

#ifndef TRACY_ENABLE

    #define ZoneStr(str)

#else

    #define ZoneStr(str) hud::tracing::TracingZoneStr(___tracy_scoped_zone, str)

namespace hud::tracing {
    inline static void TracingZoneStr(tracy::ScopedZone &zone, const std::string &str) {
        zone.Text(str.data(), str.size());
    }

    inline static void TracingZoneStr(tracy::ScopedZone &zone, const char *str) {
        zone.Text(str, strlen(str));
    }
} // namespace hud::tracing

#endif
