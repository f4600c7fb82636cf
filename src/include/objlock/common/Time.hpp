// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * objlock a distributed lock on top of object storage.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#ifndef OBJLOCK_COMMON_TIME_HPP
#define OBJLOCK_COMMON_TIME_HPP

#include <chrono>
#include <expected>
#include <string>
#include <string_view>
#include "objlock/common/Error.hpp"

namespace objlock {

using TimePoint = std::chrono::system_clock::time_point;

// UTC, nanosecond fraction with trailing zeros trimmed, "Z" suffix:
// 2026-10-19T12:00:05.1234Z
std::string toRFC3339(const TimePoint& t);

// Accepts "Z" or a numeric "+hh:mm" / "-hh:mm" offset and up to nine
// fractional digits (extra digits are truncated).
std::expected<TimePoint, Error> fromRFC3339(std::string_view s);

} // namespace objlock

#endif // OBJLOCK_COMMON_TIME_HPP
