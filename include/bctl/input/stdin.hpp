#ifndef BCTL_INPUT_STDIN_HPP
#define BCTL_INPUT_STDIN_HPP
#pragma once
/*
 * Once-only reader for the process's standard input
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

#include <istream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "../encoding.hpp"
#include "../file_to_vec.hpp"
#include "../log.hpp"

namespace bctl {

/*
 * Standard input can be consumed by at most one logical input per command.
 * A StdinReader is created once in main and handed to every resolver.
 * Reading it a second time means the stdin conflict check was bypassed
 * so it is reported as an internal error rather than silently returning
 * an empty buffer.
 */
class StdinReader {
    std::istream& is_;
    std::string reader_{};  // name of the input that consumed the stream

  public:
    explicit StdinReader(std::istream& is) : is_{is} { }
    StdinReader(const StdinReader&) = delete;
    StdinReader& operator=(const StdinReader&) = delete;

    bool consumed() const noexcept { return ! reader_.empty(); }

    bytes read(std::string_view what) {
        if (consumed())
            throw std::logic_error(format("stdin read for {} after it was consumed by {}", what, reader_));
        reader_ = what.empty()? "input" : what;
        bctl::log(L_DEBUG)("reading {} from stdin", reader_);
        return streamToVec(is_, format("{} (stdin)", reader_));
    }
};

} // namespace bctl

#endif // BCTL_INPUT_STDIN_HPP
