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
#include "objlock/common/Error.hpp"
#include <utility>
#include <string>
#include <ostream>
#include <unordered_set>
#include <unordered_map>

namespace objlock {

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    os << toString(code);
    return os;
}

std::string toString(const ErrorCode& code) {
    switch (code)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidArg: return "InvalidArgument";
        case ErrorCode::ServiceTemporarilyUnavailable: return "ServiceTemporarilyUnavailable";
        case ErrorCode::Conflict: return "Conflict";
        case ErrorCode::LockHeld: return "LockHeld";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Encoding: return "Encoding";
        case ErrorCode::Adapter: return "Adapter";
        case ErrorCode::Internal: return "Internal";
        case ErrorCode::Unknown: return "Unknown";
    }
    std::unreachable();
}

const std::unordered_map<std::string, std::unordered_set<ErrorCode, ErrorCodeHash>> retriableErrorCodes = {
    // A failed put may still have been applied by the server, so it is never
    // retried. RemoteObjectStore re-reads the object to settle the outcome.
    {"put", {}},
    {"default", {
        ErrorCode::Unknown,
        ErrorCode::ServiceTemporarilyUnavailable,
        ErrorCode::Timeout,
    }}
};

bool isRetriable(const std::string& op, const ErrorCode& code) {
    auto it = retriableErrorCodes.find(op);
    if (it != retriableErrorCodes.end()) {
        return it->second.contains(code);
    } else {
        auto d = retriableErrorCodes.find("default");
        return d->second.contains(code);
    }
}

bool isContention(const ErrorCode& code) {
    return code == ErrorCode::Conflict || code == ErrorCode::LockHeld;
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
    os << toString(error.code) << ": " << error.what;
    if (!error.bucket.empty() || !error.key.empty()) {
        os << " (" << error.bucket << "/" << error.key << ")";
    }
    return os;
}

Error::Error(const ErrorCode& c, std::string w, std::string b, std::string k) : code {c}, what {std::move(w)}, bucket {std::move(b)}, key {std::move(k)} {}
Error::Error(const ErrorCode& c, std::string w) : code {c}, what {std::move(w)}, bucket {}, key {} {}
Error::Error(const ErrorCode& c) : code {c}, what {toString(c)}, bucket {}, key {} {}

} // namespace objlock
