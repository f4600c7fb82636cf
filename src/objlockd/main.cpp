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
#include <csignal>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "objlock/server/ObjectStoreServiceImpl.hpp"
#include "objlock/storage/InMemoryObjectStore.hpp"

using objlock::InMemoryObjectStore;
using objlock::ObjectStoreServiceImpl;
using objlock::ObjectStoreServer;

namespace {

void setupLogging() {
    spdlog::init_thread_pool(8192, 1);
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "logs/objlock.txt", 1024 * 1024 * 5, 3);
    std::vector<spdlog::sink_ptr> sinks {consoleSink, fileSink};
    const auto asyncLogger = std::make_shared<spdlog::async_logger>(
        "objlockd", sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::overrun_oldest);
    spdlog::register_logger(asyncLogger);
    spdlog::set_default_logger(asyncLogger);
}

int run(int argc, char** argv) {
    if (argc < 3) {
        spdlog::error("Usage: {} <listen_address> <bucket> [bucket...]", argv[0]);
        return 1;
    }
    const std::string listenAddress {argv[1]};
    const std::vector<std::string> buckets(argv + 2, argv + argc);

    // Block the signals before the server threads start so only sigwait sees them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    InMemoryObjectStore store {};
    for (const auto& bucket : buckets) {
        store.createBucket(bucket);
        spdlog::info("Created bucket: {}", bucket);
    }
    ObjectStoreServiceImpl service {store};
    std::unique_ptr<ObjectStoreServer> server;
    try {
        server = std::make_unique<ObjectStoreServer>(listenAddress, service);
    } catch (const std::runtime_error& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    spdlog::info("objlockd ready on port {}", server->port());

    int sig = 0;
    sigwait(&signals, &sig);
    spdlog::info("Received signal {}, shutting down", sig);
    server->shutdown();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    setupLogging();
    const int result = run(argc, argv);
    spdlog::shutdown();
    return result;
}
