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
#include "objlock/client/RemoteObjectStore.hpp"
#include "objlock/common/Error.hpp"
#include "objlock/common/ErrorConverter.hpp"
#include "objlock/common/Repeater.hpp"
#include "proto/objectStore.pb.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <expected>
#include <iterator>
#include <string>
#include <vector>

namespace objlock {

namespace {

Error adapterError(const Error& cause, const Location& location) {
    return Error{ErrorCode::Adapter, toString(cause.code) + ": " + cause.what, location.bucket, location.key};
}

bool outcomeUnknown(const ErrorCode& code) {
    return code == ErrorCode::ServiceTemporarilyUnavailable || code == ErrorCode::Timeout || code == ErrorCode::Unknown;
}

void setLocation(objectStore::Location* target, const Location& location) {
    target->set_bucket(location.bucket);
    target->set_key(location.key);
}

} // namespace

RemoteObjectStore::RemoteObjectStore(const std::string& address, const RetryPolicy p)
    : addr {address},
      policy {p} {}

std::expected<std::shared_ptr<RemoteObjectStore::Stub>, Error> RemoteObjectStore::currentStub() {
    std::lock_guard<std::mutex> lock {m};
    if (channel && stub && channel->GetState(false) != GRPC_CHANNEL_SHUTDOWN) {
        return stub;
    }
    channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
    if (!channel->WaitForConnected(std::chrono::system_clock::now() + policy.channelTimeout)) {
        stub.reset();
        return std::unexpected {Error{ErrorCode::ServiceTemporarilyUnavailable, "Could not connect to service @" + addr}};
    }
    stub = objectStore::ObjectStoreService::NewStub(channel);
    return stub;
}

std::expected<std::monostate, Error> RemoteObjectStore::connect() {
    auto s = currentStub();
    if (!s.has_value()) {
        return std::unexpected {s.error()};
    }
    return {};
}

template<typename Rep, typename F>
std::expected<Rep, std::vector<Error>> RemoteObjectStore::call(const std::string& op, F rpc) {
    auto s = currentStub();
    if (!s.has_value()) {
        return std::unexpected {std::vector<Error>{s.error()}};
    }
    auto stubPtr = s.value();
    Rep reply;
    Repeater repeater {policy, stopCalls};
    auto statuses = repeater.attempt(op, [&, timeout = policy.rpcTimeout] {
        grpc::ClientContext c {};
        c.set_deadline(std::chrono::system_clock::now() + timeout);
        reply.Clear();
        return rpc(*stubPtr, &c, &reply);
    });
    if (statuses.back().ok()) {
        return reply;
    }
    std::vector<Error> errors;
    errors.reserve(statuses.size());
    std::transform(statuses.begin(), statuses.end(), std::back_inserter(errors), [](const grpc::Status& status) {
        return toError(status);
    });
    return std::unexpected {errors};
}

std::expected<objectStore::GetReply, std::vector<Error>> RemoteObjectStore::fetch(const Location& location) {
    objectStore::GetRequest getRequest;
    setLocation(getRequest.mutable_location(), location);
    return call<objectStore::GetReply>("get", [&getRequest](Stub& s, grpc::ClientContext* c, objectStore::GetReply* reply) {
        return s.get(c, getRequest, reply);
    });
}

std::expected<VersionTag, Error> RemoteObjectStore::atomicUpdate(const Location& location, const UpdateFn& fn) {
    auto got = fetch(location);
    if (!got.has_value()) {
        spdlog::warn("RemoteObjectStore: get {}/{} from {} failed: {}", location.bucket, location.key, addr, got.error().back().what);
        return std::unexpected {adapterError(got.error().back(), location)};
    }
    const VersionTag version = got.value().found() ? got.value().version() : VersionTag{};
    const std::string data = got.value().found() ? got.value().data() : std::string{};

    auto next = fn(version, data);
    if (!next.has_value()) {
        return std::unexpected {next.error()};
    }

    objectStore::PutRequest putRequest;
    setLocation(putRequest.mutable_location(), location);
    putRequest.set_data(next.value());
    putRequest.set_ifmatch(version);
    auto written = call<objectStore::PutReply>("put", [&putRequest](Stub& s, grpc::ClientContext* c, objectStore::PutReply* reply) {
        return s.put(c, putRequest, reply);
    });
    if (!written.has_value()) {
        const auto& e = written.error().back();
        if (e.code == ErrorCode::Conflict) {
            return std::unexpected {Error{ErrorCode::Conflict, e.what, location.bucket, location.key}};
        }
        if (outcomeUnknown(e.code)) {
            // The server may have applied the write before the reply was lost.
            auto check = fetch(location);
            if (check.has_value() && check.value().found() &&
                check.value().version() != version && check.value().data() == next.value()) {
                spdlog::info("RemoteObjectStore: put {}/{} to {} was applied despite: {}", location.bucket, location.key, addr, e.what);
                return check.value().version();
            }
        }
        spdlog::warn("RemoteObjectStore: put {}/{} to {} failed: {}", location.bucket, location.key, addr, e.what);
        return std::unexpected {adapterError(e, location)};
    }
    return written.value().version();
}

void RemoteObjectStore::stop() noexcept {
    stopCalls.store(true, std::memory_order_release);
}

std::string RemoteObjectStore::address() const {
    return addr;
}

} // namespace objlock
