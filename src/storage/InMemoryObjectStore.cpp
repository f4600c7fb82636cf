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
#include "objlock/storage/InMemoryObjectStore.hpp"
#include <expected>
#include <string>
#include <shared_mutex>
#include <mutex>
#include <cstddef>
#include <optional>
#include <spdlog/spdlog.h>
#include "objlock/common/Error.hpp"

namespace objlock {

InMemoryObjectStore::InMemoryObjectStore() : buckets{}, objects{}, generation{0}, m{} {}

void InMemoryObjectStore::createBucket(const std::string& bucket) {
    const std::unique_lock lock {m};
    buckets.insert(bucket);
}

std::expected<std::optional<Object>, Error> InMemoryObjectStore::get(const Location& location) const {
    const std::shared_lock lock {m};
    if (!buckets.contains(location.bucket)) {
        return std::unexpected {Error {ErrorCode::NotFound, "no such bucket", location.bucket, location.key}};
    }
    auto i = objects.find(location);
    if (i == objects.end()) {
        return std::nullopt;
    }
    return i->second;
}

std::expected<VersionTag, Error> InMemoryObjectStore::put(const Location& location, const std::string& data, const VersionTag& ifMatch) {
    const std::unique_lock lock {m};
    if (!buckets.contains(location.bucket)) {
        return std::unexpected {Error {ErrorCode::NotFound, "no such bucket", location.bucket, location.key}};
    }
    auto i = objects.find(location);
    if (i != objects.end()) {
        if (ifMatch != i->second.version) {
            return std::unexpected {Error {ErrorCode::Conflict, "version mismatch: expected " + i->second.version + " but got " + (ifMatch.empty() ? "<absent>" : ifMatch), location.bucket, location.key}};
        }
        i->second = Object{data, std::to_string(++generation)};
        return i->second.version;
    }
    if (!ifMatch.empty()) {
        return std::unexpected {Error {ErrorCode::Conflict, "object does not exist, expected version " + ifMatch, location.bucket, location.key}};
    }
    auto j = objects.emplace(location, Object{data, std::to_string(++generation)}).first;
    return j->second.version;
}

std::expected<VersionTag, Error> InMemoryObjectStore::atomicUpdate(const Location& location, const UpdateFn& fn) {
    auto current = get(location);
    if (!current.has_value()) {
        return std::unexpected {Error {ErrorCode::Adapter, current.error().what, location.bucket, location.key}};
    }
    const auto version = current.value().has_value() ? current.value()->version : VersionTag{};
    const auto data = current.value().has_value() ? current.value()->data : std::string{};

    auto next = fn(version, data);
    if (!next.has_value()) {
        return std::unexpected {next.error()};
    }

    auto written = put(location, next.value(), version);
    if (!written.has_value()) {
        if (written.error().code == ErrorCode::Conflict) {
            spdlog::debug("InMemoryObjectStore: conflict on {}/{}: {}", location.bucket, location.key, written.error().what);
            return std::unexpected {written.error()};
        }
        return std::unexpected {Error {ErrorCode::Adapter, written.error().what, location.bucket, location.key}};
    }
    return written;
}

size_t InMemoryObjectStore::size() const {
    const std::shared_lock lock {m};
    return objects.size();
}

} // namespace objlock
