/*
 * bctl - create, attenuate, exchange third-party blocks for, seal and
 *        inspect chained authorization tokens
 *
 * bctl [-v|--verbose]... [-h|--help] [--version] <command> [args]
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

#include <getopt.h>
#include <iostream>

#include "bctl/cmd/commands.hpp"
#include "bctl/log.hpp"

#ifndef BCTL_VERSION
#define BCTL_VERSION "0.0.0"
#endif

using namespace bctl;

static struct option opts[] {
    {"verbose", no_argument, nullptr, 'v'},
    {"help", no_argument, nullptr, 'h'},
    {"version", no_argument, nullptr, 'V'},
    {}
};

static void usage(std::string_view pname) {
    std::cerr << format("- usage: {} [-v|--verbose]... [-h|--help] [--version] <command> [args]\n"
                        "  commands:\n", pname);
    for (const auto& c : cmd::commands) std::cerr << format("    {:36} {}\n", c.name, c.help);
    std::cerr << format("  '{} <command> --help' shows a command's arguments\n", pname);
}

static void usage(std::string_view pname, const cmd::Command& c) {
    std::cerr << format("- usage: {} {} {}\n  {}\n", pname, c.name, c.synopsis, c.help);
}

int main(int argc, char* const* argv) {
    std::string_view pname{argv[0]};
    if (auto s = pname.rfind('/'); s != pname.npos) pname.remove_prefix(s + 1);

    // global options stop at the first non-option (the command)
    int verbose{};
    opterr = 0;
    for (int c; (c = getopt_long(argc, argv, "+vh", opts, nullptr)) != -1; ) {
        switch (c) {
        case 'v':
            ++verbose;
            break;
        case 'h':
            usage(pname);
            exit(0);
        case 'V':
            print("{} {}\n", pname, BCTL_VERSION);
            exit(0);
        default:
            std::cerr << format("error: unknown option '{}'\n", argv[optind - 1]);
            usage(pname);
            exit(2);
        }
    }
    if (optind >= argc) {
        usage(pname);
        exit(2);
    }
    configure_logging(verbose);

    const auto* c = cmd::findCommand(argv[optind]);
    if (! c) {
        std::cerr << format("error: unknown command '{}'\n", argv[optind]);
        usage(pname);
        exit(2);
    }

    try {
        sodiumInit();
        StdinReader in{std::cin};
        ExternalEditor editor{};
        Env env{in, std::cout, editor, std::chrono::system_clock::now()};
        if (! cmd::runCommand(*c, argc - optind, argv + optind, env)) usage(pname, *c);
    } catch (const error& e) {
        std::cerr << format("error: {}\n", e.what());
        if (e.kind() == errc::usage) {
            usage(pname, *c);
            exit(2);
        }
        exit(1);
    } catch (const std::logic_error& e) {
        std::cerr << format("internal error: {}\n", e.what());
        exit(3);
    } catch (const std::runtime_error& se) {
        std::cerr << format("runtime error: {}\n", se.what());
        exit(1);
    }
    exit(0);
}
