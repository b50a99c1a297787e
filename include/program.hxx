/*
    bft - A brainfuck tape interpreter
    Program model and parser
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "instruction.hxx"
#include "status.hxx"

namespace bft {

/// @brief A parsed brainfuck program: its name and the instructions found in the source.
///
/// Brackets are paired while parsing. A bracket without a partner is kept with an empty
/// partner and reported by validate(), which must succeed before the program is executed.
/// The instruction list is never modified after construction, so one Program can be lent to
/// any number of VMs at once.
class Program {
   public:
    Program() = default;
    /// @param name Used only in diagnostics, usually the path the source came from.
    /// @param source Raw source text. Characters other than the eight commands are skipped but
    /// still count for line and column numbers.
    Program(std::string name, std::string_view source);

    /// @brief Loads and parses a source file.
    /// @return Status of the read. On failure 'out' is left unchanged.
    static Status fromFile(const std::string& path, Program& out);

    /// @brief Checks every bracket has a partner.
    /// @return UnmatchedOpen / UnmatchedClose for the first unpaired bracket, in source order.
    Status validate() const;

    const std::string& name() const noexcept { return filename; }
    const std::vector<instruction>& instructions() const noexcept { return code; }
    std::size_t size() const noexcept { return code.size(); }
    bool empty() const noexcept { return code.empty(); }
    const instruction& operator[](std::size_t i) const { return code[i]; }

    /// Writes "<name>: <line>:<column> <action>" for every instruction.
    void listing(std::ostream& out) const;

   private:
    std::string filename;
    std::vector<instruction> code;
};

}  // namespace bft
