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
#ifndef OBJLOCK_LOCK_LOCK_RECORD_HPP
#define OBJLOCK_LOCK_LOCK_RECORD_HPP

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include "objlock/common/Error.hpp"
#include "objlock/common/Time.hpp"

namespace objlock {

using FenceToken = int64_t;

// The whole content of a lock object, stored as
// {"id": <holder>, "expires": <RFC 3339>, "fence": <int>}. Empty fields are
// omitted. An expired record keeps its holder until the next acquisition.
struct LockRecord {
    std::string holder;
    std::optional<TimePoint> expiresAt;
    FenceToken fence {0};

    [[nodiscard]] bool held(const TimePoint& now) const;

    [[nodiscard]] std::expected<std::string, Error> encode() const;
    // Empty data is the zero record.
    static std::expected<LockRecord, Error> decode(const std::string& data);

    bool operator==(const LockRecord& other) const = default;
};

} // namespace objlock

#endif // OBJLOCK_LOCK_LOCK_RECORD_HPP
