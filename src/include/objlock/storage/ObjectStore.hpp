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
#ifndef OBJLOCK_STORAGE_OBJECT_STORE_HPP
#define OBJLOCK_STORAGE_OBJECT_STORE_HPP

#include <expected>
#include <functional>
#include <string>
#include "objlock/common/Error.hpp"

namespace objlock {

// Opaque revision of a stored object. Empty means the object does not exist.
using VersionTag = std::string;

struct Location {
    std::string bucket;
    std::string key;

    bool operator==(const Location& other) const {
        return bucket == other.bucket && key == other.key;
    }
};

struct LocationHash {
    std::size_t operator()(const Location& location) const {
        return std::hash<std::string>()(location.bucket) ^ (std::hash<std::string>()(location.key) << 1);
    }
};

using UpdateFn = std::function<std::expected<std::string, Error>(const VersionTag& current, const std::string& data)>;

// A provider reads the object (absent reads as empty data and an empty tag),
// calls fn exactly once and writes its result only if the tag is unchanged.
// Losing that race yields ErrorCode::Conflict, an error returned by fn comes
// back unchanged with nothing written, and any other failure is
// ErrorCode::Adapter.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual std::expected<VersionTag, Error> atomicUpdate(const Location& location, const UpdateFn& fn) = 0;
};

} // namespace objlock

#endif // OBJLOCK_STORAGE_OBJECT_STORE_HPP
