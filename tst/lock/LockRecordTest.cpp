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
#include <chrono>
#include <string>
#include "objlock/lock/LockRecord.hpp"
#include "objlock/common/Error.hpp"
#include "objlock/common/Time.hpp"

using objlock::LockRecord;
using objlock::ErrorCode;
using objlock::TimePoint;
using namespace std::chrono_literals;

TEST(LockRecordTest, EmptyDataIsZeroRecord) {
    auto r = LockRecord::decode("");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), LockRecord{});
    EXPECT_FALSE(r->held(std::chrono::system_clock::now()));
}

TEST(LockRecordTest, ZeroRecordEncodesAsEmptyObject) {
    auto e = LockRecord{}.encode();
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e.value(), "{}");
}

TEST(LockRecordTest, EncodesAllFields) {
    const LockRecord r {"holder-1", TimePoint{} + 1500ms, 3};
    auto e = r.encode();
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e.value(), R"({"expires":"1970-01-01T00:00:01.5Z","fence":3,"id":"holder-1"})");
}

TEST(LockRecordTest, ReleasedRecordKeepsOnlyFence) {
    const LockRecord r {"", std::nullopt, 9};
    auto e = r.encode();
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e.value(), R"({"fence":9})");
}

TEST(LockRecordTest, DecodesWhatItEncodes) {
    const LockRecord r {"holder-1", std::chrono::system_clock::now() + 10s, 42};
    auto e = r.encode();
    ASSERT_TRUE(e.has_value());
    auto d = LockRecord::decode(e.value());
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d.value(), r);
}

TEST(LockRecordTest, DecodesForeignWriterRecord) {
    auto d = LockRecord::decode(R"({"id":"abc","expires":"2030-01-02T03:04:05.123456789+01:00","fence":7,"extra":true})");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->holder, "abc");
    EXPECT_EQ(d->fence, 7);
    ASSERT_TRUE(d->expiresAt.has_value());
    auto expected = objlock::fromRFC3339("2030-01-02T02:04:05.123456789Z");
    ASSERT_TRUE(expected.has_value());
    EXPECT_EQ(d->expiresAt.value(), expected.value());
}

TEST(LockRecordTest, NullFieldsAreAbsent) {
    auto d = LockRecord::decode(R"({"id":null,"expires":null,"fence":null})");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d.value(), LockRecord{});
}

TEST(LockRecordTest, HeldUntilExpiry) {
    const auto now = std::chrono::system_clock::now();
    const LockRecord r {"holder-1", now, 1};
    EXPECT_TRUE(r.held(now - 1s));
    EXPECT_TRUE(r.held(now));
    EXPECT_FALSE(r.held(now + 1ns));
}

TEST(LockRecordTest, NotHeldWithoutHolderOrExpiry) {
    const auto now = std::chrono::system_clock::now();
    EXPECT_FALSE((LockRecord{"", now + 10s, 1}).held(now));
    EXPECT_FALSE((LockRecord{"holder-1", std::nullopt, 1}).held(now));
}

TEST(LockRecordTest, MalformedDataIsEncodingError) {
    for (const auto* s : {
        "not json",
        "[]",
        "42",
        R"({"id":5})",
        R"({"expires":17})",
        R"({"expires":"yesterday"})",
        R"({"fence":"3"})",
        R"({"fence":1.5})",
        R"({"fence":-1})"}) {
        auto d = LockRecord::decode(s);
        ASSERT_FALSE(d.has_value()) << s;
        EXPECT_EQ(d.error().code, ErrorCode::Encoding) << s;
    }
}

TEST(LockRecordTest, ExpiryBeyondClockRangeIsEncodingError) {
    auto d = LockRecord::decode(R"({"id":"abc","expires":"3000-01-01T00:00:00Z","fence":1})");
    ASSERT_FALSE(d.has_value());
    EXPECT_EQ(d.error().code, ErrorCode::Encoding);
}
