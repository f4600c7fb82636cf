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
#ifndef OBJLOCK_CLIENT_REMOTE_OBJECT_STORE_HPP
#define OBJLOCK_CLIENT_REMOTE_OBJECT_STORE_HPP

#include <atomic>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>
#include <grpcpp/grpcpp.h>
#include "proto/objectStore.grpc.pb.h"
#include "objlock/common/Error.hpp"
#include "objlock/common/RetryPolicy.hpp"
#include "objlock/storage/ObjectStore.hpp"

namespace objlock {

// ObjectStore provider backed by an objlockd server. Failed reads are
// retried according to the RetryPolicy before they surface as
// ErrorCode::Adapter. Writes are sent once, a write whose reply was lost is
// confirmed by reading the object back. Safe to share between threads.
class RemoteObjectStore : public ObjectStore {
public:
    RemoteObjectStore(const std::string& address, const RetryPolicy p);
    RemoteObjectStore(const RemoteObjectStore&) = delete;
    RemoteObjectStore& operator=(const RemoteObjectStore&) = delete;
    std::expected<std::monostate, Error> connect();
    std::expected<VersionTag, Error> atomicUpdate(const Location& location, const UpdateFn& fn) override;
    // Aborts pending retries, calls made afterwards fail.
    void stop() noexcept;
    [[nodiscard]] std::string address() const;
private:
    using Stub = objectStore::ObjectStoreService::Stub;
    std::expected<std::shared_ptr<Stub>, Error> currentStub();
    std::expected<objectStore::GetReply, std::vector<Error>> fetch(const Location& location);
    template<typename Rep, typename F>
    std::expected<Rep, std::vector<Error>> call(const std::string& op, F rpc);
    mutable std::mutex m;
    std::string addr;
    RetryPolicy policy;
    std::shared_ptr<grpc::Channel> channel;
    std::shared_ptr<Stub> stub;
    std::atomic<bool> stopCalls {false};
};

} // namespace objlock

#endif // OBJLOCK_CLIENT_REMOTE_OBJECT_STORE_HPP
