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
#include "objlock/common/Time.hpp"
#include "objlock/common/Error.hpp"
#include <chrono>
#include <cstdio>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace objlock {

namespace {

std::optional<int> digits(std::string_view s, size_t pos, size_t n) {
    if (pos + n > s.size()) {
        return std::nullopt;
    }
    int v = 0;
    for (size_t i = pos; i < pos + n; ++i) {
        if (s[i] < '0' || s[i] > '9') {
            return std::nullopt;
        }
        v = v * 10 + (s[i] - '0');
    }
    return v;
}

bool expect(std::string_view s, size_t pos, char c) {
    return pos < s.size() && s[pos] == c;
}

Error malformed(std::string_view s) {
    return Error{ErrorCode::Encoding, "malformed RFC 3339 timestamp: \"" + std::string{s} + "\""};
}

} // namespace

std::string toRFC3339(const TimePoint& t) {
    using namespace std::chrono;
    const auto ns = time_point_cast<nanoseconds>(t);
    const auto midnight = floor<days>(ns);
    const year_month_day ymd {midnight};
    const hh_mm_ss hms {ns - midnight};
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d",
        static_cast<int>(ymd.year()),
        static_cast<unsigned int>(ymd.month()),
        static_cast<unsigned int>(ymd.day()),
        static_cast<int>(hms.hours().count()),
        static_cast<int>(hms.minutes().count()),
        static_cast<int>(hms.seconds().count()));
    std::string result {buf};
    auto frac = hms.subseconds().count();
    if (frac > 0) {
        std::snprintf(buf, sizeof(buf), ".%09lld", static_cast<long long>(frac));
        std::string f {buf};
        f.erase(f.find_last_not_of('0') + 1);
        result += f;
    }
    result.push_back('Z');
    return result;
}

std::expected<TimePoint, Error> fromRFC3339(std::string_view s) {
    using namespace std::chrono;
    auto y = digits(s, 0, 4);
    auto mo = digits(s, 5, 2);
    auto d = digits(s, 8, 2);
    auto h = digits(s, 11, 2);
    auto mi = digits(s, 14, 2);
    auto sec = digits(s, 17, 2);
    if (!y || !mo || !d || !h || !mi || !sec ||
        !expect(s, 4, '-') || !expect(s, 7, '-') ||
        !(expect(s, 10, 'T') || expect(s, 10, 't')) ||
        !expect(s, 13, ':') || !expect(s, 16, ':')) {
        return std::unexpected {malformed(s)};
    }
    const year_month_day ymd {year{*y}, month{static_cast<unsigned int>(*mo)}, day{static_cast<unsigned int>(*d)}};
    if (!ymd.ok() || *h > 23 || *mi > 59 || *sec > 59) {
        return std::unexpected {malformed(s)};
    }

    size_t pos = 19;
    int64_t fraction = 0;
    if (expect(s, pos, '.')) {
        ++pos;
        int n = 0;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            if (n < 9) {
                fraction = fraction * 10 + (s[pos] - '0');
                ++n;
            }
            ++pos;
        }
        if (n == 0) {
            return std::unexpected {malformed(s)};
        }
        for (; n < 9; ++n) {
            fraction *= 10;
        }
    }

    minutes offset {0};
    if (expect(s, pos, 'Z') || expect(s, pos, 'z')) {
        ++pos;
    } else if (expect(s, pos, '+') || expect(s, pos, '-')) {
        auto oh = digits(s, pos + 1, 2);
        auto om = digits(s, pos + 4, 2);
        if (!oh || !om || !expect(s, pos + 3, ':') || *oh > 23 || *om > 59) {
            return std::unexpected {malformed(s)};
        }
        offset = hours{*oh} + minutes{*om};
        if (s[pos] == '-') {
            offset = -offset;
        }
        pos += 6;
    } else {
        return std::unexpected {malformed(s)};
    }
    if (pos != s.size()) {
        return std::unexpected {malformed(s)};
    }

    // Whole seconds first, a year past 2262 does not fit TimePoint's nanoseconds.
    const sys_seconds whole = sys_days{ymd} + hours{*h} + minutes{*mi} + seconds{*sec} - offset;
    if (whole <= floor<seconds>(TimePoint::min()) || whole >= floor<seconds>(TimePoint::max())) {
        return std::unexpected {Error{ErrorCode::Encoding, "RFC 3339 timestamp out of range: \"" + std::string{s} + "\""}};
    }
    return time_point_cast<TimePoint::duration>(whole) + duration_cast<TimePoint::duration>(nanoseconds{fraction});
}

} // namespace objlock
