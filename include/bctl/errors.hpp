#ifndef BCTL_ERRORS_HPP
#define BCTL_ERRORS_HPP
#pragma once
/*
 * bctl error kinds
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

/*
 * Every failure a user can cause is thrown as a bctl::error carrying one of
 * the kinds below. Failures that can only come from a bctl bug (e.g., a
 * resolver run before input validation) are std::logic_error.
 */

#include <stdexcept>
#include <string>
#include <string_view>

#include "format.hpp"

namespace bctl {

enum class errc {
    usage,          // bad command line (reported with the usage line)
    io,             // unreadable or unwritable file/stream
    malformedKey,   // bad hex/PEM/raw key material
    malformedToken, // bad base64 or token/request/block/snapshot framing
    invalidText,    // non UTF-8 where text is required
    multipleStdin,  // two logical inputs bound to stdin
    editor,         // interactive editor failed or produced nothing
    parse,          // datalog, TTL, duration or param syntax
    delegate        // signature, sealing, authorization or limit failures
};

static constexpr std::string_view errcName(errc e) noexcept {
    switch (e) {
        case errc::usage: return "usage";
        case errc::io: return "io";
        case errc::malformedKey: return "malformed key";
        case errc::malformedToken: return "malformed token";
        case errc::invalidText: return "invalid text";
        case errc::multipleStdin: return "multiple stdin consumers";
        case errc::editor: return "editor";
        case errc::parse: return "parse";
        case errc::delegate: return "delegate";
    }
    return "unknown";
}

struct error : std::runtime_error {
    errc kind_;

    error(errc kind, const std::string& msg) : std::runtime_error(msg), kind_{kind} { }

    errc kind() const noexcept { return kind_; }
};

// throw a bctl::error of kind 'k' with a formatted message
template <typename... T>
[[noreturn]] inline void fail(errc k, fmt::format_string<T...> fmt, T&&... args) {
    throw error(k, format(fmt, std::forward<T>(args)...));
}

} // namespace bctl

#endif // BCTL_ERRORS_HPP
