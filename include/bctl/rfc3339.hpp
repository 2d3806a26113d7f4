#ifndef BCTL_RFC3339_HPP
#define BCTL_RFC3339_HPP
#pragma once
/*
 * RFC3339 timestamps <-> seconds since the unix epoch
 *
 * Copyright (C) 2025 The bctl authors
 *
 *  This program is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU Lesser General Public License as
 *  published by the Free Software Foundation; either version 2.1 of
 *  the License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with this program; if not, see <https://www.gnu.org/licenses/>.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "format.hpp"

namespace bctl {

using namespace std::literals::chrono_literals;
using sysTime = std::chrono::sys_seconds;

// length of the longest prefix of 's' that could be an RFC3339 timestamp
static constexpr size_t rfc3339Span(std::string_view s) noexcept {
    size_t n = 0;
    while (n < s.size()) {
        char c = s[n];
        if (! ((c >= '0' && c <= '9') || c == '-' || c == ':' || c == '.' || c == '+' || c == 'T' || c == 't'
               || c == 'Z' || c == 'z')) break;
        ++n;
    }
    return n;
}

/*
 * Parse YYYY-MM-DDTHH:MM:SS[.frac](Z|+HH:MM|-HH:MM). Fractional seconds are
 * accepted and truncated. Dates before the epoch are rejected since datalog
 * dates are unsigned.
 */
static inline std::optional<sysTime> parseRfc3339(std::string_view s) noexcept {
    using namespace std::chrono;
    size_t p = 0;
    auto num = [&](size_t digits, int& out) {
        if (p + digits > s.size()) return false;
        out = 0;
        for (size_t i = 0; i < digits; ++i) {
            char c = s[p+i];
            if (c < '0' || c > '9') return false;
            out = out * 10 + (c - '0');
        }
        p += digits;
        return true;
    };
    auto lit = [&](auto pred) { if (p >= s.size() || ! pred(s[p])) return false; ++p; return true; };
    auto is = [](char want) { return [want](char c) { return c == want; }; };

    int Y, M, D, h, m, sec;
    if (! num(4, Y) || ! lit(is('-')) || ! num(2, M) || ! lit(is('-')) || ! num(2, D)) return std::nullopt;
    if (! lit([](char c) { return c == 'T' || c == 't' || c == ' '; })) return std::nullopt;
    if (! num(2, h) || ! lit(is(':')) || ! num(2, m) || ! lit(is(':')) || ! num(2, sec)) return std::nullopt;
    if (p < s.size() && s[p] == '.') {
        ++p;
        size_t f = p;
        while (p < s.size() && s[p] >= '0' && s[p] <= '9') ++p;
        if (p == f) return std::nullopt;
    }
    int offset = 0;
    if (lit([](char c) { return c == 'Z' || c == 'z'; })) {
        // utc
    } else if (p < s.size() && (s[p] == '+' || s[p] == '-')) {
        int sign = s[p++] == '-'? -1 : 1;
        int oh, om;
        if (! num(2, oh) || ! lit(is(':')) || ! num(2, om) || oh > 23 || om > 59) return std::nullopt;
        offset = sign * (oh * 3600 + om * 60);
    } else return std::nullopt;
    if (p != s.size()) return std::nullopt;

    year_month_day ymd{year{Y}, month{unsigned(M)}, day{unsigned(D)}};
    if (! ymd.ok() || h > 23 || m > 59 || sec > 60) return std::nullopt;
    auto t = sys_days{ymd} + hours{h} + minutes{m} + seconds{sec} - seconds{offset};
    if (t.time_since_epoch().count() < 0) return std::nullopt;
    return time_point_cast<seconds>(t);
}

static inline sysTime fromEpoch(uint64_t secs) noexcept { return sysTime{std::chrono::seconds(int64_t(secs))}; }

static inline uint64_t toEpoch(sysTime t) noexcept { return uint64_t(t.time_since_epoch().count()); }

// always UTC with a 'Z' suffix
static inline std::string toRfc3339(sysTime t) {
    using namespace std::chrono;
    auto dp = floor<days>(t);
    year_month_day ymd{dp};
    hh_mm_ss hms{t - dp};
    return format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}Z", int(ymd.year()), unsigned(ymd.month()), unsigned(ymd.day()),
                  hms.hours().count(), hms.minutes().count(), hms.seconds().count());
}

} // namespace bctl

#endif // BCTL_RFC3339_HPP
