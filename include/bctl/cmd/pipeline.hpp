#ifndef BCTL_CMD_PIPELINE_HPP
#define BCTL_CMD_PIPELINE_HPP
#pragma once
/*
 * Shared resolve -> validate -> delegate -> encode sequence of the bctl commands
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
 * A command declares every input source it will use, then calls validate()
 * (which applies the stdin conflict rule to all of them at once), then
 * resolves them. Resolving before validate() is an internal error, so no
 * input can be read before all conflicts have been checked.
 * Output goes through write() / writeText() after all delegate work is
 * done so a failed command writes nothing.
 */

#include <chrono>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "../encoding.hpp"
#include "../input/conflicts.hpp"
#include "../input/editor.hpp"
#include "../input/resolve.hpp"
#include "../input/stdin.hpp"
#include "../log.hpp"

namespace bctl {

// what a command runs against
struct Env {
    StdinReader& in;
    std::ostream& out;
    Editor& editor;
    std::chrono::system_clock::time_point now;
};

// raw bytes, or base64 text with no trailing newline
static inline void encodeOutput(std::ostream& os, byteSpan payload, bool raw) {
    if (raw) os.write(reinterpret_cast<const char*>(payload.data()), payload.size());
    else os << toBase64(payload);
    os.flush();
    if (! os) fail(errc::io, "can't write output");
}

class Pipeline {
    Env& env_;
    std::string cmd_;
    std::vector<namedInput> inputs_{};
    bool validated_{false};

    void ready(std::string_view what) const {
        if (! validated_) throw std::logic_error(format("{}: {} resolved before input validation", cmd_, what));
    }

  public:
    Pipeline(Env& env, std::string cmd) : env_{env}, cmd_{std::move(cmd)} { }

    template <typename Src>
    Pipeline& input(std::string name, const Src& src) {
        if (validated_) throw std::logic_error(format("{}: input {} declared after validation", cmd_, name));
        inputs_.push_back({std::move(name), src.readsStdin()});
        return *this;
    }
    template <typename Src>
    Pipeline& input(std::string name, const std::optional<Src>& src) {
        if (src) input(std::move(name), *src);
        return *this;
    }

    Pipeline& validate() {
        checkStdinConflicts(inputs_);
        validated_ = true;
        bctl::log(L_DEBUG)("{}: {} input(s) validated", cmd_, inputs_.size());
        return *this;
    }

    const Env& env() const noexcept { return env_; }
    auto now() const noexcept { return env_.now; }

    PrivateKey privateKey(const KeySource& ks, std::string_view what = "private key") {
        ready(what);
        return resolveKey(ks, env_.in, what);
    }
    PublicKey publicKey(const KeySource& ks, std::string_view what = "public key") {
        ready(what);
        return resolvePublicKey(ks, env_.in, what);
    }
    bytes token(const TokenSource& ts, std::string_view what = "token") {
        ready(what);
        return resolveToken(ts, env_.in, what);
    }
    std::string datalog(const DatalogSource& ds, std::string_view what = "datalog") {
        ready(what);
        return resolveDatalog(ds, env_.in, env_.editor, what);
    }

    void write(byteSpan payload, bool raw) { encodeOutput(env_.out, payload, raw); }

    void writeText(std::string_view text) {
        env_.out << text;
        env_.out.flush();
        if (! env_.out) fail(errc::io, "can't write output");
    }
};

} // namespace bctl

#endif // BCTL_CMD_PIPELINE_HPP
