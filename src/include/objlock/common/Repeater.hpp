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
#ifndef OBJLOCK_COMMON_REPEATER_HPP
#define OBJLOCK_COMMON_REPEATER_HPP

#include <functional>
#include "objlock/common/RetryPolicy.hpp"
#include "objlock/common/ExponentialBackoff.hpp"
#include "objlock/common/FullJitter.hpp"
#include <grpcpp/support/status.h>
#include <vector>
#include <string>
#include <atomic>

namespace objlock {

// Retries an RPC while it fails with an error that isRetriable for op,
// sleeping a jittered exponential backoff between attempts. Returns every
// status observed, the last one is the outcome.
class Repeater {
public:
    Repeater(const RetryPolicy p, std::atomic<bool>& sc);
    std::vector<grpc::Status> attempt(const std::string& op, const std::function<grpc::Status()>& rpc);
private:
    ExponentialBackoff backoff;
    FullJitter fullJitter;
    std::atomic<bool>& stopped;
};

} // namespace objlock

#endif // OBJLOCK_COMMON_REPEATER_HPP
