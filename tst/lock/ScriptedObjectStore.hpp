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
#ifndef OBJLOCK_TST_SCRIPTED_OBJECT_STORE_HPP
#define OBJLOCK_TST_SCRIPTED_OBJECT_STORE_HPP

#include <atomic>
#include <deque>
#include <expected>
#include <mutex>
#include "objlock/common/Error.hpp"
#include "objlock/storage/ObjectStore.hpp"

namespace objlock::test {

// Forwards to another store, failing the next queued calls with the given
// errors instead. Failed calls never reach the wrapped store.
class ScriptedObjectStore : public ObjectStore {
public:
    explicit ScriptedObjectStore(ObjectStore& s) : store {s} {}

    std::expected<VersionTag, Error> atomicUpdate(const Location& location, const UpdateFn& fn) override {
        ++calls;
        {
            std::lock_guard<std::mutex> lock {m};
            if (!failures.empty()) {
                auto e = failures.front();
                failures.pop_front();
                return std::unexpected {e};
            }
        }
        return store.atomicUpdate(location, fn);
    }

    void failNext(const Error& e, int times = 1) {
        std::lock_guard<std::mutex> lock {m};
        for (int i = 0; i < times; ++i) {
            failures.push_back(e);
        }
    }

    std::atomic<int> calls {0};
private:
    ObjectStore& store;
    std::mutex m;
    std::deque<Error> failures;
};

} // namespace objlock::test

#endif // OBJLOCK_TST_SCRIPTED_OBJECT_STORE_HPP
