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
#include "objlock/server/ObjectStoreServiceImpl.hpp"
#include "objlock/common/ErrorConverter.hpp"
#include "objlock/common/Error.hpp"
#include "objlock/storage/ObjectStore.hpp"
#include <grpcpp/support/status.h>
#include "proto/objectStore.pb.h"
#include <spdlog/spdlog.h>
#include <tuple>

namespace objlock {

ObjectStoreServiceImpl::ObjectStoreServiceImpl(InMemoryObjectStore& s)
    : store {s} {}

grpc::Status ObjectStoreServiceImpl::get(
    grpc::ServerContext* context,
    const objectStore::GetRequest* request,
    objectStore::GetReply* reply) {
    std::ignore = context;
    const Location location{request->location().bucket(), request->location().key()};
    auto v = store.get(location);
    if (!v.has_value()) {
        return toGrpcStatus(v.error());
    }
    if (!v.value().has_value()) {
        reply->set_found(false);
        return grpc::Status::OK;
    }
    reply->set_found(true);
    reply->set_data(v.value()->data);
    reply->set_version(v.value()->version);
    return grpc::Status::OK;
}

grpc::Status ObjectStoreServiceImpl::put(
    grpc::ServerContext* context,
    const objectStore::PutRequest* request,
    objectStore::PutReply* reply) {
    std::ignore = context;
    const Location location{request->location().bucket(), request->location().key()};
    auto v = store.put(location, request->data(), request->ifmatch());
    if (!v.has_value()) {
        spdlog::debug("ObjectStoreService: put {}/{} rejected: {}", location.bucket, location.key, v.error().what);
        return toGrpcStatus(v.error());
    }
    reply->set_version(v.value());
    return grpc::Status::OK;
}

} // namespace objlock
