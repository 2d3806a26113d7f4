#ifndef BCTL_TESTS_TEST_HPP
#define BCTL_TESTS_TEST_HPP
#pragma once
/*
 * test.hpp -- helpers shared by the bctl unit tests
 *
 * Copyright (C) 2025 The bctl authors
 *
 *  This program is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program; if not, see <https://www.gnu.org/licenses/>.
 */

#include <unistd.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "bctl/cmd/commands.hpp"

void test_log_off();
void test_log_on();

namespace bctl::test {

// returns canned text and counts how often it was asked for some
struct FakeEditor : Editor {
    std::string text_;
    int calls_{};

    explicit FakeEditor(std::string text = {}) : text_{std::move(text)} { }

    std::string edit(std::string_view what) override {
        ++calls_;
        if (text_.empty()) fail(errc::editor, "no {} was entered in the editor", what);
        return text_;
    }
};

// a scratch file that's removed when it goes out of scope
struct TempFile {
    std::string path_;

    explicit TempFile(std::string_view contents = {}) {
        const char* dir = std::getenv("TMPDIR");
        path_ = std::string(dir && *dir? dir : "/tmp") + "/bctl_test_XXXXXX";
        int fd = mkstemp(path_.data());
        if (fd < 0) throw std::runtime_error("can't create temp file");
        ::close(fd);
        write(contents);
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    ~TempFile() { ::unlink(path_.c_str()); }

    void write(std::string_view contents) const {
        std::ofstream os{path_, std::ios::binary | std::ios::trunc};
        os.write(contents.data(), contents.size());
    }

    std::string read() const {
        std::ifstream is{path_, std::ios::binary};
        std::stringstream ss{};
        ss << is.rdbuf();
        return ss.str();
    }

    const std::string& path() const noexcept { return path_; }
};

/*
 * Run bctl subcommand args[0] with 'in' as its standard input and return
 * what it wrote on standard output.
 */
inline std::string runCmd(std::vector<std::string> args, std::string in = {}, Editor* ed = nullptr) {
    const auto* c = cmd::findCommand(args.at(0));
    if (! c) throw std::logic_error("no such command " + args.at(0));
    std::vector<char*> argv{};
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::istringstream is{in};
    StdinReader reader{is};
    std::ostringstream os{};
    FakeEditor none{};
    Env env{reader, os, ed? *ed : none, std::chrono::system_clock::now()};
    cmd::runCommand(*c, int(args.size()), argv.data(), env);
    return os.str();
}

inline std::string hexKey(const PrivateKey& k) { return k.toPrefixedString(); }

// a base64 token with the given authority block
inline std::string makeToken(const PrivateKey& root, std::string_view authority) {
    BlockBuilder bb{};
    bb.addCode(authority);
    return Token::build(root, bb).toBase64();
}

} // namespace bctl::test

#endif // BCTL_TESTS_TEST_HPP
