/*
 * testdriver.cpp -- bctl unit tests
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

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "test.hpp"

void test_log_off() {
    if (auto* dl = dynamic_cast<bctl::DefaultLogger*>(bctl::global_logger()); dl) dl->min_level = bctl::L_FATAL;
}

void test_log_on() {
    if (auto* dl = dynamic_cast<bctl::DefaultLogger*>(bctl::global_logger()); dl) dl->min_level = bctl::L_WARN;
}

int main(int argc, char* argv[]) {
    bctl::sodiumInit();
    test_log_off();
    return Catch::Session().run(argc, argv);
}
