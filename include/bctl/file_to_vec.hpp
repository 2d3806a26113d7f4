#ifndef BCTL_FILE_TO_VEC_HPP
#define BCTL_FILE_TO_VEC_HPP
/*
 * fileToVec - read the contents of a file (or stream) into a vector
 *
 * Copyright (C) 2021-5 Pollere LLC
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
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include "errors.hpp"

namespace bctl {

// nothing bctl reads (keys, tokens, datalog, snapshots) is anywhere near this big
static constexpr size_t maxInputSize = 16 * 1024 * 1024;

static inline std::vector<uint8_t> streamToVec(std::istream& is, std::string_view what) {
    std::vector<uint8_t> buf{};
    char chunk[4096];
    while (is.read(chunk, sizeof(chunk)) || is.gcount() > 0) {
        buf.insert(buf.end(), chunk, chunk + is.gcount());
        if (buf.size() > maxInputSize) fail(errc::io, "{} is unreasonably large (> {} bytes)", what, maxInputSize);
    }
    if (is.bad()) fail(errc::io, "couldn't read {}", what);
    return buf;
}

static inline std::vector<uint8_t> fileToVec(std::string_view fname) {
    std::string f{fname};
    std::ifstream is(f, std::ios::binary|std::ios::ate);
    if (! is) fail(errc::io, "can't open file {}", fname);
    auto sz = is.tellg();
    if (sz < 0 || size_t(sz) > maxInputSize) fail(errc::io, "{} file size unreasonable ({} bytes)", fname, (long long)sz);
    is.seekg(0);
    std::vector<uint8_t> buf(sz);
    if (sz > 0 && ! is.read((char*)buf.data(), buf.size())) fail(errc::io, "couldn't read file {}", fname);
    is.close();
    return buf;
}

static inline void vecToFile(std::string_view fname, const std::vector<uint8_t>& buf) {
    std::ofstream os{std::string(fname), std::ios::binary};
    if (! os) fail(errc::io, "can't create file {}", fname);
    os.write((const char*)buf.data(), buf.size());
    if (! os) fail(errc::io, "couldn't write file {}", fname);
}

} // namespace bctl

#endif // BCTL_FILE_TO_VEC_HPP
