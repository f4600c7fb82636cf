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
#ifndef OBJLOCK_LOCK_MUTEX_HPP
#define OBJLOCK_LOCK_MUTEX_HPP

#include <chrono>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>
#include <variant>
#include "objlock/common/Error.hpp"
#include "objlock/common/FullJitter.hpp"
#include "objlock/common/RetryPolicy.hpp"
#include "objlock/lock/LockRecord.hpp"
#include "objlock/storage/ObjectStore.hpp"

namespace objlock {

// A lock shared by every Mutex bound to the same location, in any process.
// All coordination goes through ObjectStore::atomicUpdate on the lock object.
// A Mutex is one holder identity and must not be used by two threads at once.
class Mutex {
public:
    Mutex(ObjectStore& s, Location l, const RetryPolicy p = defaultLockPolicy());
    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;

    // One attempt. std::nullopt means the lock is held by someone else or
    // another contender won the write, try again later.
    [[nodiscard]] std::expected<std::optional<FenceToken>, Error> tryLock(std::chrono::milliseconds length);

    // Retries tryLock with jittered exponential backoff until it acquires,
    // the stop token fires (Cancelled) or the deadline passes (Timeout).
    [[nodiscard]] std::expected<FenceToken, Error> lock(std::chrono::milliseconds length, std::stop_token stop = {});
    [[nodiscard]] std::expected<FenceToken, Error> lock(
        std::chrono::milliseconds length,
        std::chrono::steady_clock::time_point deadline,
        std::stop_token stop = {});

    // Releases the lock if this handle still holds it. A lock that has
    // already been taken over by another holder is left alone.
    [[nodiscard]] std::expected<std::monostate, Error> unlock();

    [[nodiscard]] const std::string& identity() const;
    [[nodiscard]] const Location& location() const;
    // True between a successful acquisition and the next release. The lease
    // may have expired in the meantime.
    [[nodiscard]] bool holding() const;
private:
    void sleep(std::chrono::microseconds delay, std::chrono::steady_clock::time_point deadline, const std::stop_token& stop) const;
    ObjectStore& store;
    Location loc;
    RetryPolicy policy;
    std::string id;
    VersionTag version;
    FullJitter fullJitter;
};

// Creates the lock object with an empty record if it does not exist yet.
// An existing record is never rewritten.
std::expected<std::monostate, Error> ensureLockObject(ObjectStore& store, const Location& location);

} // namespace objlock

#endif // OBJLOCK_LOCK_MUTEX_HPP
