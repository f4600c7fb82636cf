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
#include <gtest/gtest.h>
#include <expected>
#include <string>
#include <thread>
#include <vector>
#include <atomic>
#include "objlock/storage/InMemoryObjectStore.hpp"
#include "objlock/common/Error.hpp"

using objlock::InMemoryObjectStore;
using objlock::Location;
using objlock::VersionTag;
using objlock::Error;
using objlock::ErrorCode;

class InMemoryObjectStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store.createBucket("locks");
    }
    InMemoryObjectStore store;
    const Location loc {"locks", "job"};
};

TEST_F(InMemoryObjectStoreTest, GetMissingObject) {
    auto got = store.get(loc);
    ASSERT_TRUE(got.has_value());
    EXPECT_FALSE(got.value().has_value());
}

TEST_F(InMemoryObjectStoreTest, GetMissingBucket) {
    auto got = store.get(Location{"nope", "job"});
    ASSERT_FALSE(got.has_value());
    EXPECT_EQ(got.error().code, ErrorCode::NotFound);
}

TEST_F(InMemoryObjectStoreTest, CreateRequiresEmptyIfMatch) {
    auto stale = store.put(loc, "a", "7");
    ASSERT_FALSE(stale.has_value());
    EXPECT_EQ(stale.error().code, ErrorCode::Conflict);
    auto created = store.put(loc, "a", "");
    ASSERT_TRUE(created.has_value());
    EXPECT_FALSE(created.value().empty());
    auto again = store.put(loc, "b", "");
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::Conflict);
}

TEST_F(InMemoryObjectStoreTest, PutWithMatchingVersion) {
    auto v1 = store.put(loc, "a", "");
    ASSERT_TRUE(v1.has_value());
    auto v2 = store.put(loc, "b", v1.value());
    ASSERT_TRUE(v2.has_value());
    EXPECT_NE(v1.value(), v2.value());
    auto stale = store.put(loc, "c", v1.value());
    ASSERT_FALSE(stale.has_value());
    EXPECT_EQ(stale.error().code, ErrorCode::Conflict);
    auto got = store.get(loc);
    ASSERT_TRUE(got.has_value());
    ASSERT_TRUE(got.value().has_value());
    EXPECT_EQ(got.value().value().data, "b");
    EXPECT_EQ(got.value().value().version, v2.value());
}

TEST_F(InMemoryObjectStoreTest, AtomicUpdateSeesAbsentObject) {
    VersionTag seenVersion {"unset"};
    std::string seenData {"unset"};
    auto v = store.atomicUpdate(loc, [&](const VersionTag& current, const std::string& data) -> std::expected<std::string, Error> {
        seenVersion = current;
        seenData = data;
        return "first";
    });
    ASSERT_TRUE(v.has_value());
    EXPECT_TRUE(seenVersion.empty());
    EXPECT_TRUE(seenData.empty());
    EXPECT_EQ(store.size(), 1);
}

TEST_F(InMemoryObjectStoreTest, AtomicUpdatePassesCurrentState) {
    auto v1 = store.put(loc, "a", "");
    ASSERT_TRUE(v1.has_value());
    auto v2 = store.atomicUpdate(loc, [&](const VersionTag& current, const std::string& data) -> std::expected<std::string, Error> {
        EXPECT_EQ(current, v1.value());
        return data + "b";
    });
    ASSERT_TRUE(v2.has_value());
    auto got = store.get(loc);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got.value().value().data, "ab");
    EXPECT_EQ(got.value().value().version, v2.value());
}

TEST_F(InMemoryObjectStoreTest, AtomicUpdateTransformErrorWritesNothing) {
    auto v1 = store.put(loc, "a", "");
    ASSERT_TRUE(v1.has_value());
    auto v = store.atomicUpdate(loc, [](const VersionTag&, const std::string&) -> std::expected<std::string, Error> {
        return std::unexpected {Error{ErrorCode::LockHeld, "busy"}};
    });
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().code, ErrorCode::LockHeld);
    EXPECT_EQ(v.error().what, "busy");
    auto got = store.get(loc);
    EXPECT_EQ(got.value().value().version, v1.value());
}

TEST_F(InMemoryObjectStoreTest, AtomicUpdateLosesRace) {
    auto v = store.atomicUpdate(loc, [this](const VersionTag&, const std::string&) -> std::expected<std::string, Error> {
        auto sneaky = store.put(loc, "other", "");
        EXPECT_TRUE(sneaky.has_value());
        return "mine";
    });
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().code, ErrorCode::Conflict);
    auto got = store.get(loc);
    EXPECT_EQ(got.value().value().data, "other");
}

TEST_F(InMemoryObjectStoreTest, AtomicUpdateMissingBucketIsAdapterError) {
    int calls = 0;
    auto v = store.atomicUpdate(Location{"nope", "job"}, [&calls](const VersionTag&, const std::string&) -> std::expected<std::string, Error> {
        ++calls;
        return "x";
    });
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().code, ErrorCode::Adapter);
    EXPECT_EQ(calls, 0);
}

TEST_F(InMemoryObjectStoreTest, ConcurrentIncrementsAreNotLost) {
    const int threads = 4;
    const int perThread = 50;
    std::atomic<int> conflicts {0};
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&]() {
            int done = 0;
            while (done < perThread) {
                auto v = store.atomicUpdate(loc, [](const VersionTag&, const std::string& data) -> std::expected<std::string, Error> {
                    const int n = data.empty() ? 0 : std::stoi(data);
                    return std::to_string(n + 1);
                });
                if (v.has_value()) {
                    ++done;
                } else {
                    ASSERT_EQ(v.error().code, ErrorCode::Conflict);
                    ++conflicts;
                }
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    auto got = store.get(loc);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got.value().value().data, std::to_string(threads * perThread));
}
