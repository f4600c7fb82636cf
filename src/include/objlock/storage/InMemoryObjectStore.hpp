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
#ifndef OBJLOCK_STORAGE_IN_MEMORY_OBJECT_STORE_HPP
#define OBJLOCK_STORAGE_IN_MEMORY_OBJECT_STORE_HPP

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <shared_mutex>
#include <mutex>
#include <expected>
#include <optional>
#include <cstdint>
#include "objlock/common/Error.hpp"
#include "objlock/storage/ObjectStore.hpp"

namespace objlock {

struct Object {
    std::string data;
    VersionTag version;

    bool operator==(const Object& other) const {
        return data == other.data && version == other.version;
    }
};

class InMemoryObjectStore : public ObjectStore {
public:
    InMemoryObjectStore();
    void createBucket(const std::string& bucket);
    std::expected<std::optional<Object>, Error> get(const Location& location) const;
    // An empty ifMatch only succeeds when the object does not exist yet.
    std::expected<VersionTag, Error> put(const Location& location, const std::string& data, const VersionTag& ifMatch);
    std::expected<VersionTag, Error> atomicUpdate(const Location& location, const UpdateFn& fn) override;
    size_t size() const;
private:
    std::unordered_set<std::string> buckets;
    std::unordered_map<Location, Object, LocationHash> objects;
    uint64_t generation;
    mutable std::shared_mutex m;
};

} // namespace objlock

#endif // OBJLOCK_STORAGE_IN_MEMORY_OBJECT_STORE_HPP
