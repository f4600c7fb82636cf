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
#ifndef OBJLOCK_COMMON_ERROR_HPP
#define OBJLOCK_COMMON_ERROR_HPP

#include <string>
#include <ostream>
#include <unordered_set>
#include <unordered_map>
#include <functional>
#include <type_traits>

namespace objlock {

enum class ErrorCode {
    OK = 0,
    InvalidArg = 1,
    ServiceTemporarilyUnavailable = 2,
    Conflict = 3,
    LockHeld = 4,
    NotFound = 5,
    Timeout = 6,
    Cancelled = 7,
    Encoding = 8,
    Adapter = 9,
    Internal = 10,
    Unknown = 128
};

struct ErrorCodeHash {
    std::size_t operator()(const ErrorCode& code) const noexcept {
        return std::hash<std::underlying_type_t<ErrorCode>>{}(static_cast<std::underlying_type_t<ErrorCode>>(code));
    }
};

extern const std::unordered_map<std::string, std::unordered_set<ErrorCode, ErrorCodeHash>> retriableErrorCodes;
bool isRetriable(const std::string& op, const ErrorCode& code);

// Conflict and LockHeld are the outcomes of losing a race for the lock object.
bool isContention(const ErrorCode& code);

std::ostream& operator<<(std::ostream& os, const ErrorCode& code);

std::string toString(const ErrorCode& code);

struct Error {
    ErrorCode code;
    std::string what;
    std::string bucket;
    std::string key;

    Error(const ErrorCode& c, std::string w);
    Error(const ErrorCode& c, std::string w, std::string b, std::string k);
    explicit Error(const ErrorCode& c);
};

std::ostream& operator<<(std::ostream& os, const Error& error);

} // namespace objlock

#endif // OBJLOCK_COMMON_ERROR_HPP
