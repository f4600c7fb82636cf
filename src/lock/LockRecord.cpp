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
#include "objlock/lock/LockRecord.hpp"
#include "objlock/common/Error.hpp"
#include "objlock/common/Time.hpp"
#include <nlohmann/json.hpp>
#include <expected>
#include <string>

namespace objlock {

namespace {

constexpr auto holderField = "id";
constexpr auto expiresField = "expires";
constexpr auto fenceField = "fence";

} // namespace

bool LockRecord::held(const TimePoint& now) const {
    return !holder.empty() && expiresAt.has_value() && now <= expiresAt.value();
}

std::expected<std::string, Error> LockRecord::encode() const {
    try {
        nlohmann::json j = nlohmann::json::object();
        if (!holder.empty()) {
            j[holderField] = holder;
        }
        if (expiresAt.has_value()) {
            j[expiresField] = toRFC3339(expiresAt.value());
        }
        if (fence != 0) {
            j[fenceField] = fence;
        }
        return j.dump();
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected {Error{ErrorCode::Encoding, std::string{"cannot encode lock record: "} + e.what()}};
    }
}

std::expected<LockRecord, Error> LockRecord::decode(const std::string& data) {
    LockRecord record;
    if (data.empty()) {
        return record;
    }
    try {
        const auto j = nlohmann::json::parse(data);
        if (!j.is_object()) {
            return std::unexpected {Error{ErrorCode::Encoding, "lock record is not a JSON object"}};
        }
        if (auto it = j.find(holderField); it != j.end() && !it->is_null()) {
            if (!it->is_string()) {
                return std::unexpected {Error{ErrorCode::Encoding, "lock record holder is not a string"}};
            }
            record.holder = it->get<std::string>();
        }
        if (auto it = j.find(expiresField); it != j.end() && !it->is_null()) {
            if (!it->is_string()) {
                return std::unexpected {Error{ErrorCode::Encoding, "lock record expiry is not a string"}};
            }
            auto expires = fromRFC3339(it->get<std::string>());
            if (!expires.has_value()) {
                return std::unexpected {expires.error()};
            }
            record.expiresAt = expires.value();
        }
        if (auto it = j.find(fenceField); it != j.end() && !it->is_null()) {
            if (!it->is_number_integer()) {
                return std::unexpected {Error{ErrorCode::Encoding, "lock record fence is not an integer"}};
            }
            record.fence = it->get<FenceToken>();
            if (record.fence < 0) {
                return std::unexpected {Error{ErrorCode::Encoding, "lock record fence is negative"}};
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected {Error{ErrorCode::Encoding, std::string{"cannot decode lock record: "} + e.what()}};
    }
    return record;
}

} // namespace objlock
