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
#include <set>
#include <string>
#include "objlock/common/Util.hpp"

using objlock::generate_uuid_v7;
using objlock::uuid_v7_to_string;

TEST(UtilTest, UuidStringHasCanonicalLayout) {
    auto s = uuid_v7_to_string(generate_uuid_v7());
    ASSERT_EQ(s.size(), 36);
    EXPECT_EQ(s[8], '-');
    EXPECT_EQ(s[13], '-');
    EXPECT_EQ(s[18], '-');
    EXPECT_EQ(s[23], '-');
    EXPECT_EQ(s[14], '7');
    EXPECT_NE(std::string{"89ab"}.find(s[19]), std::string::npos);
    EXPECT_EQ(s.find_first_not_of("0123456789abcdef-"), std::string::npos);
}

TEST(UtilTest, UuidsAreDistinct) {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        seen.insert(uuid_v7_to_string(generate_uuid_v7()));
    }
    EXPECT_EQ(seen.size(), 1000);
}

TEST(UtilTest, KnownBytesFormat) {
    objlock::UUIDV7 uuid{0x01, 0x92, 0x3f, 0x00, 0xaa, 0xbb, 0x7c, 0xdd, 0x8e, 0xff, 0x00, 0x11, 0x22, 0x33, 0x44, 0x55};
    EXPECT_EQ(uuid_v7_to_string(uuid), "01923f00-aabb-7cdd-8eff-001122334455");
}
