#ifndef BCTL_INPUT_CONFLICTS_HPP
#define BCTL_INPUT_CONFLICTS_HPP
#pragma once
/*
 * Cross-input checks the option parser can't express
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

#include <string>
#include <vector>

#include "../errors.hpp"

namespace bctl {

struct namedInput {
    std::string name;   // e.g., "token", "block"
    bool readsStdin;
};

// Standard input can feed at most one input. Must be called before anything is read.
static inline void checkStdinConflicts(const std::vector<namedInput>& inputs) {
    const namedInput* first{};
    for (const auto& i : inputs) {
        if (! i.readsStdin) continue;
        if (first) fail(errc::multipleStdin, "standard input can only be used by one input but both the {} and the {} read it",
                        first->name, i.name);
        first = &i;
    }
}

} // namespace bctl

#endif // BCTL_INPUT_CONFLICTS_HPP
