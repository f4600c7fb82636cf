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
#ifndef OBJLOCK_SERVER_RPC_SERVER_HPP
#define OBJLOCK_SERVER_RPC_SERVER_HPP

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>

namespace objlock {

// Serves one gRPC service on a background thread. Binding port 0 picks a
// free port, port() reports the one actually bound.
template<typename Service>
class RPCServer {
public:
    RPCServer(const std::string& address, Service& s, std::chrono::milliseconds grace = std::chrono::milliseconds{10L});
    ~RPCServer();
    RPCServer(const RPCServer&) = delete;
    RPCServer& operator=(const RPCServer&) = delete;
    RPCServer(RPCServer&&) = delete;
    RPCServer& operator=(RPCServer&&) = delete;
    [[nodiscard]] int port() const;
    // In-flight calls get the grace period to finish, then are cancelled.
    void shutdown();
private:
    std::string addr;
    std::chrono::milliseconds gracePeriod;
    int boundPort {0};
    std::unique_ptr<grpc::Server> server;
    std::thread waiter;
};

template<typename Service>
RPCServer<Service>::RPCServer(const std::string& address, Service& s, const std::chrono::milliseconds grace)
    : addr {address}, gracePeriod {grace} {
    grpc::ServerBuilder builder {};
    builder.AddListeningPort(addr, grpc::InsecureServerCredentials(), &boundPort);
    builder.RegisterService(&s);
    server = builder.BuildAndStart();
    if (!server || boundPort == 0) {
        server.reset();
        throw std::runtime_error("cannot listen on " + address);
    }
    spdlog::info("RPCServer: listening on {} (port {})", addr, boundPort);
    waiter = std::thread([this]() { server->Wait(); });
}

template<typename Service>
int RPCServer<Service>::port() const {
    return boundPort;
}

template<typename Service>
void RPCServer<Service>::shutdown() {
    if (!server) {
        return;
    }
    server->Shutdown(std::chrono::system_clock::now() + gracePeriod);
    if (waiter.joinable()) {
        waiter.join();
    }
    server.reset();
    spdlog::info("RPCServer: stopped listening on {}", addr);
}

template<typename Service>
RPCServer<Service>::~RPCServer() {
    shutdown();
}

} // namespace objlock

#endif // OBJLOCK_SERVER_RPC_SERVER_HPP
