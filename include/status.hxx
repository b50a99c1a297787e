/*
    bft - A brainfuck tape interpreter
    Error reporting types
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "instruction.hxx"

namespace bft {

// Codes match the values the interpreter has always returned from execute():
// 1 and 2 for bracket mismatches, -1 for the head leaving the tape.
enum class ErrorKind : int8_t {
    None = 0,
    UnmatchedClose = 1,
    UnmatchedOpen = 2,
    HeadOutOfBounds = -1,
    Io = 3,
};

/// @brief Result of a parser, loader or VM operation. Default constructed means success.
struct Status {
    ErrorKind kind = ErrorKind::None;
    /// Instruction that caused the failure. Empty for loader errors.
    std::optional<instruction> where{};
    /// Underlying cause of an I/O failure, or which edge the head fell off.
    std::string cause{};

    bool ok() const noexcept { return kind == ErrorKind::None; }
    int code() const noexcept { return static_cast<int>(kind); }

    /// Short message without position, e.g. "Unmatched open bracket".
    std::string message() const;
    /// Full rendering: "<name>:<line>:<column>: <message> (<action>)[: <cause>]".
    std::string describe(std::string_view name) const;

    static Status success() { return {}; }
    static Status unmatched(const instruction& ins);
    static Status outOfBounds(const instruction& ins, bool beforeStart);
    static Status io(std::string cause, std::optional<instruction> ins = std::nullopt);
};

}  // namespace bft
