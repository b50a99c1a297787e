/*
    bft - A brainfuck tape interpreter
    Source file loading
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <string>

namespace bft {

// Reads a whole source file, comments and newlines included, using a read-only memory map
// when possible. Returns true on success; on error, 'err' is set and 'out' left unchanged.
bool readSourceFile(const std::string& filename, std::string& out, std::string& err);

}  // namespace bft
