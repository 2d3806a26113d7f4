#ifndef BCTL_INPUT_EDITOR_HPP
#define BCTL_INPUT_EDITOR_HPP
#pragma once
/*
 * Interactive editing of datalog with the user's $VISUAL / $EDITOR
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

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

extern "C" {
    #include <fcntl.h>
    #include <sys/wait.h>
    #include <unistd.h>
};

#include "../encoding.hpp"
#include "../errors.hpp"
#include "../file_to_vec.hpp"
#include "../log.hpp"

namespace bctl {

// Something that turns an initial buffer into user-supplied text.
struct Editor {
    virtual ~Editor() = default;
    // 'what' names the text being edited (e.g., "authority block")
    virtual std::string edit(std::string_view what) = 0;
};

/*
 * Runs the editor named by $VISUAL, $EDITOR or "vi" on a scratch file in
 * $TMPDIR (default /tmp). The editor's stdin is the controlling terminal
 * when there is one since the process's stdin may be carrying a token.
 */
class ExternalEditor : public Editor {
    // removes the scratch file however edit() exits
    struct scratchFile {
        std::string path_;
        explicit scratchFile(std::string p) : path_{std::move(p)} { }
        ~scratchFile() { if (! path_.empty()) ::unlink(path_.c_str()); }
    };

    static std::vector<std::string> command() {
        const char* e = std::getenv("VISUAL");
        if (! e || ! *e) e = std::getenv("EDITOR");
        std::string_view cmd = (e && *e)? e : "vi";
        std::vector<std::string> argv{};
        while (! cmd.empty()) {
            auto b = cmd.find_first_not_of(" \t");
            if (b == cmd.npos) break;
            cmd.remove_prefix(b);
            auto n = cmd.find_first_of(" \t");
            argv.emplace_back(cmd.substr(0, n));
            cmd.remove_prefix(n == cmd.npos? cmd.size() : n);
        }
        if (argv.empty()) argv.emplace_back("vi");
        return argv;
    }

    static void run(std::vector<std::string> argv) {
        std::vector<char*> cargv;
        cargv.reserve(argv.size() + 1);
        for (auto& s : argv) cargv.push_back(s.data());
        cargv.push_back(nullptr);

        pid_t pid = ::fork();
        if (pid < 0) fail(errc::editor, "unable to start editor {}: {}", argv[0], std::strerror(errno));
        if (pid == 0) {
            if (int tty = ::open("/dev/tty", O_RDWR); tty >= 0) {
                ::dup2(tty, STDIN_FILENO);
                ::dup2(tty, STDOUT_FILENO);
                ::close(tty);
            }
            ::execvp(cargv[0], cargv.data());
            ::_exit(127);
        }
        int st = 0;
        while (::waitpid(pid, &st, 0) < 0) {
            if (errno != EINTR) fail(errc::editor, "lost track of editor {}: {}", argv[0], std::strerror(errno));
        }
        if (! WIFEXITED(st)) fail(errc::editor, "editor {} terminated abnormally", argv[0]);
        if (WEXITSTATUS(st) == 127) fail(errc::editor, "unable to run editor {}", argv[0]);
        if (WEXITSTATUS(st) != 0) fail(errc::editor, "editor {} exited with status {}", argv[0], WEXITSTATUS(st));
    }

  public:
    std::string edit(std::string_view what) override {
        const char* t = std::getenv("TMPDIR");
        std::string tmpl = format("{}/bctl-XXXXXX.datalog", (t && *t)? t : "/tmp");
        int fd = ::mkstemps(tmpl.data(), 8);
        if (fd < 0) fail(errc::editor, "can't create scratch file {}: {}", tmpl, std::strerror(errno));
        ::close(fd);
        scratchFile scratch{tmpl};

        auto argv = command();
        argv.emplace_back(scratch.path_);
        bctl::log(L_DEBUG)("editing {} with {} {}", what, argv[0], scratch.path_);
        run(std::move(argv));

        auto buf = fileToVec(scratch.path_);
        if (! validUtf8(buf)) fail(errc::invalidText, "{} from the editor is not valid UTF-8", what);
        std::string text{asSv(buf)};
        if (text.find_first_not_of(" \t\r\n") == text.npos) fail(errc::editor, "no {} was entered in the editor", what);
        return text;
    }
};

} // namespace bctl

#endif // BCTL_INPUT_EDITOR_HPP
