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
#ifndef OBJLOCK_SERVER_OBJECT_STORE_SERVICE_IMPL_HPP
#define OBJLOCK_SERVER_OBJECT_STORE_SERVICE_IMPL_HPP

#include <grpcpp/grpcpp.h>
#include "proto/objectStore.grpc.pb.h"
#include "objlock/server/RPCServer.hpp"
#include "objlock/storage/InMemoryObjectStore.hpp"

namespace objlock {

class ObjectStoreServiceImpl final : public objectStore::ObjectStoreService::Service {
public:
    explicit ObjectStoreServiceImpl(InMemoryObjectStore& s);
    grpc::Status get(
        grpc::ServerContext* context,
        const objectStore::GetRequest* request,
        objectStore::GetReply* reply) override;
    grpc::Status put(
        grpc::ServerContext* context,
        const objectStore::PutRequest* request,
        objectStore::PutReply* reply) override;
private:
    InMemoryObjectStore& store;
};

using ObjectStoreServer = RPCServer<ObjectStoreServiceImpl>;

} // namespace objlock

#endif // OBJLOCK_SERVER_OBJECT_STORE_SERVICE_IMPL_HPP
