#ifndef BCTL_FORMAT_HPP
#define BCTL_FORMAT_HPP
#pragma once
/*
 * Copyright (C) 2020-5 Pollere LLC
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
 *  You may contact Pollere LLC at info@pollere.net.
 */

// defining BCTL_USE_STD_FORMAT will attempt to use the c++ standard libraries
// 'format' routines instead of the github.com/fmtlib/fmt equivalents.
#if BCTL_USE_STD_FORMAT
#include <format>
#include <iostream>

namespace bctl {
    using std::format;
    using std::format_to;
    using std::formatter;

template <typename... T>
inline void print(std::format_string<T...> fmt, T&&... args) {
    std::cout << format(fmt, args...);
}

} // namespace bctl
#else

#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif
#include "fmt/format.h"
#include "fmt/ostream.h"
#include "fmt/ranges.h"
#include "fmt/chrono.h"

namespace bctl {
    using fmt::format;
    using fmt::format_to;
    using fmt::formatter;
    using fmt::print;
} // namespace bctl

#endif

#endif // BCTL_FORMAT_HPP
