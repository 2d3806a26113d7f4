#ifndef BCTL_INPUT_TTL_HPP
#define BCTL_INPUT_TTL_HPP
#pragma once
/*
 * Durations ("15m", "1h30m", "100ms") and TTLs (a duration or an RFC3339 expiration)
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
#include <variant>

#include "../errors.hpp"
#include "../rfc3339.hpp"

namespace bctl {

/*
 * A duration is one or more <integer><unit> pieces, optionally separated by
 * spaces, with units ns, us, ms, s, m, h, d and w (plus the long forms
 * sec, min, hour(s), day(s), week(s)). "1h30m" is 90 minutes.
 */
static inline std::optional<std::chrono::nanoseconds> parseDuration(std::string_view s) noexcept {
    using namespace std::chrono;
    static constexpr std::pair<std::string_view, int64_t> units[] = {
        {"ns", 1}, {"us", 1'000}, {"ms", 1'000'000},
        {"seconds", 1'000'000'000}, {"second", 1'000'000'000}, {"secs", 1'000'000'000}, {"sec", 1'000'000'000},
        {"s", 1'000'000'000},
        {"minutes", 60'000'000'000}, {"minute", 60'000'000'000}, {"mins", 60'000'000'000}, {"min", 60'000'000'000},
        {"m", 60'000'000'000},
        {"hours", 3'600'000'000'000}, {"hour", 3'600'000'000'000}, {"h", 3'600'000'000'000},
        {"days", 86'400'000'000'000}, {"day", 86'400'000'000'000}, {"d", 86'400'000'000'000},
        {"weeks", 604'800'000'000'000}, {"week", 604'800'000'000'000}, {"w", 604'800'000'000'000}
    };
    int64_t total = 0;
    bool any = false;
    size_t p = 0;
    auto skipSp = [&] { while (p < s.size() && s[p] == ' ') ++p; };
    skipSp();
    while (p < s.size()) {
        size_t d = p;
        int64_t n = 0;
        while (p < s.size() && s[p] >= '0' && s[p] <= '9') {
            if (__builtin_mul_overflow(n, 10, &n) || __builtin_add_overflow(n, s[p] - '0', &n)) return std::nullopt;
            ++p;
        }
        if (p == d) return std::nullopt;
        size_t u = p;
        while (p < s.size() && s[p] >= 'a' && s[p] <= 'z') ++p;
        auto unit = s.substr(u, p - u);
        bool found = false;
        for (const auto& [name, mult] : units) {
            if (unit != name) continue;
            int64_t v;
            if (__builtin_mul_overflow(n, mult, &v) || __builtin_add_overflow(total, v, &total)) return std::nullopt;
            found = true;
            break;
        }
        if (! found) return std::nullopt;
        any = true;
        skipSp();
    }
    if (! any) return std::nullopt;
    return nanoseconds{total};
}

/*
 * --add-ttl value. An RFC3339 timestamp is tried first and is an absolute
 * expiration, otherwise it must be a duration which is added to the time
 * the expiration check gets attached.
 */
class Ttl {
    std::variant<sysTime, std::chrono::nanoseconds> v_;

    explicit Ttl(sysTime t) : v_{t} { }
    explicit Ttl(std::chrono::nanoseconds d) : v_{d} { }

    // 9999-12-31T23:59:59Z, the last instant an RFC3339 date can express
    static constexpr int64_t maxEpoch = 253402300799;

  public:
    /*
     * Durations are checked against the current time here so a TTL whose
     * expiration can't be represented fails before anything gets signed.
     */
    static Ttl parse(std::string_view s, std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) {
        if (auto t = parseRfc3339(s); t) return Ttl{*t};
        if (auto d = parseDuration(s); d) {
            Ttl ttl{*d};
            ttl.expiration(now);
            return ttl;
        }
        fail(errc::parse, "invalid TTL '{}': expected an RFC3339 date (e.g., 2025-04-01T00:00:00Z) or a duration (e.g., 1d, 15m)", s);
    }

    bool isDuration() const noexcept { return std::holds_alternative<std::chrono::nanoseconds>(v_); }

    // the absolute expiration (seconds precision, rounded down) for a check attached at 'now'
    sysTime expiration(std::chrono::system_clock::time_point now) const {
        using namespace std::chrono;
        if (auto t = std::get_if<sysTime>(&v_); t) return *t;
        // whole seconds and sub-second parts are summed separately since now + d in
        // nanoseconds overflows for durations of a few centuries
        auto d = std::get<nanoseconds>(v_);
        auto base = floor<seconds>(now);
        auto frac = duration_cast<nanoseconds>(now - base) + (d - floor<seconds>(d));
        int64_t at;
        if (__builtin_add_overflow(base.time_since_epoch().count(), floor<seconds>(d).count() + floor<seconds>(frac).count(), &at)
            || at > maxEpoch)
            fail(errc::parse, "TTL puts the expiration past 9999-12-31T23:59:59Z");
        return sysTime{seconds{at}};
    }
};

// the datalog of an expiration check
static inline std::string expirationCheck(sysTime exp) {
    return format("check if time($time), $time <= {};", toRfc3339(exp));
}

} // namespace bctl

#endif // BCTL_INPUT_TTL_HPP
