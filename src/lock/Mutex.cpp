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
#include "objlock/lock/Mutex.hpp"
#include "objlock/lock/LockRecord.hpp"
#include "objlock/common/Error.hpp"
#include "objlock/common/ExponentialBackoff.hpp"
#include "objlock/common/Util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <expected>
#include <limits>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <variant>

namespace objlock {

namespace {

// now + length must stay representable as a TimePoint.
bool leaseFits(const TimePoint& now, const std::chrono::milliseconds length) {
    return length <= std::chrono::duration_cast<std::chrono::milliseconds>(TimePoint::max() - now);
}

} // namespace

Mutex::Mutex(ObjectStore& s, Location l, const RetryPolicy p)
    : store {s},
      loc {std::move(l)},
      policy {p},
      id {uuid_v7_to_string(generate_uuid_v7())},
      version {} {}

std::expected<std::optional<FenceToken>, Error> Mutex::tryLock(const std::chrono::milliseconds length) {
    if (length <= std::chrono::milliseconds::zero()) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "lease length must be positive", loc.bucket, loc.key}};
    }
    if (!leaseFits(std::chrono::system_clock::now(), length)) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "lease length is out of range", loc.bucket, loc.key}};
    }
    FenceToken fence = 0;
    auto v = store.atomicUpdate(loc, [this, length, &fence](const VersionTag&, const std::string& data) -> std::expected<std::string, Error> {
        auto record = LockRecord::decode(data);
        if (!record.has_value()) {
            return std::unexpected {record.error()};
        }
        const auto now = std::chrono::system_clock::now();
        if (record->held(now)) {
            return std::unexpected {Error{ErrorCode::LockHeld, "lock is held by " + record->holder, loc.bucket, loc.key}};
        }
        if (!leaseFits(now, length)) {
            return std::unexpected {Error{ErrorCode::InvalidArg, "lease length is out of range", loc.bucket, loc.key}};
        }
        if (record->fence == std::numeric_limits<FenceToken>::max()) {
            return std::unexpected {Error{ErrorCode::Encoding, "lock record fence is exhausted", loc.bucket, loc.key}};
        }
        record->holder = id;
        record->expiresAt = now + length;
        record->fence++;
        fence = record->fence;
        return record->encode();
    });
    if (!v.has_value()) {
        if (isContention(v.error().code)) {
            spdlog::debug("Mutex {}: {}/{} not acquired: {}", id, loc.bucket, loc.key, v.error().what);
            return std::nullopt;
        }
        spdlog::warn("Mutex {}: acquiring {}/{} failed: {}", id, loc.bucket, loc.key, v.error().what);
        return std::unexpected {v.error()};
    }
    version = v.value();
    spdlog::info("Mutex {}: acquired {}/{} with fence {}", id, loc.bucket, loc.key, fence);
    return fence;
}

std::expected<FenceToken, Error> Mutex::lock(const std::chrono::milliseconds length, std::stop_token stop) {
    return lock(length, std::chrono::steady_clock::time_point::max(), std::move(stop));
}

std::expected<FenceToken, Error> Mutex::lock(
    const std::chrono::milliseconds length,
    const std::chrono::steady_clock::time_point deadline,
    std::stop_token stop) {
    ExponentialBackoff backoff {policy};
    while (true) {
        if (stop.stop_requested()) {
            return std::unexpected {Error{ErrorCode::Cancelled, "lock acquisition cancelled", loc.bucket, loc.key}};
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::unexpected {Error{ErrorCode::Timeout, "lock acquisition timed out", loc.bucket, loc.key}};
        }
        auto t = tryLock(length);
        if (!t.has_value()) {
            return std::unexpected {t.error()};
        }
        if (t.value().has_value()) {
            return t.value().value();
        }
        auto delay = fullJitter.jitter(backoff.nextDelay().value_or(policy.maxDelay));
        sleep(delay, deadline, stop);
    }
    std::unreachable();
}

void Mutex::sleep(const std::chrono::microseconds delay, const std::chrono::steady_clock::time_point deadline, const std::stop_token& stop) const {
    auto remaining = delay;
    while (!stop.stop_requested() && remaining > std::chrono::microseconds::zero()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return;
        }
        auto step = std::min<std::chrono::microseconds>(remaining, std::chrono::microseconds{1000});
        std::this_thread::sleep_for(step);
        remaining -= step;
    }
}

std::expected<std::monostate, Error> Mutex::unlock() {
    if (version.empty()) {
        return {};
    }
    auto v = store.atomicUpdate(loc, [this](const VersionTag& current, const std::string& data) -> std::expected<std::string, Error> {
        if (current != version) {
            return std::unexpected {Error{ErrorCode::Conflict, "lock was taken over", loc.bucket, loc.key}};
        }
        auto record = LockRecord::decode(data);
        if (!record.has_value()) {
            return std::unexpected {record.error()};
        }
        record->holder.clear();
        record->expiresAt.reset();
        return record->encode();
    });
    if (!v.has_value()) {
        if (v.error().code != ErrorCode::Conflict) {
            spdlog::warn("Mutex {}: releasing {}/{} failed: {}", id, loc.bucket, loc.key, v.error().what);
            return std::unexpected {v.error()};
        }
        spdlog::info("Mutex {}: {}/{} was already taken over", id, loc.bucket, loc.key);
    } else {
        spdlog::info("Mutex {}: released {}/{}", id, loc.bucket, loc.key);
    }
    version.clear();
    return {};
}

const std::string& Mutex::identity() const {
    return id;
}

const Location& Mutex::location() const {
    return loc;
}

bool Mutex::holding() const {
    return !version.empty();
}

std::expected<std::monostate, Error> ensureLockObject(ObjectStore& store, const Location& location) {
    auto v = store.atomicUpdate(location, [&location](const VersionTag& current, const std::string&) -> std::expected<std::string, Error> {
        if (!current.empty()) {
            return std::unexpected {Error{ErrorCode::Conflict, "lock object exists", location.bucket, location.key}};
        }
        return LockRecord{}.encode();
    });
    // Conflict means the object exists, either already or because another
    // process created it first.
    if (!v.has_value() && v.error().code != ErrorCode::Conflict) {
        return std::unexpected {v.error()};
    }
    return {};
}

} // namespace objlock
