/*
    bft - A brainfuck tape interpreter
    VM API declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#define BFT_VERSION "1.0.0"
#define BFT_DEFAULT_TAPE_SIZE 30000
#define BFT_DEFAULT_EXTENSIBLE 0
#define BFT_TAPE_WARN_BYTES (1ull << 30)  // 1 GiB
// Hard limit to prevent uncontrolled memory allocation from user inputs.
// Requests exceeding this limit are rejected by the CLI.
#define BFT_TAPE_MAX_BYTES (1ull << 31)  // 2 GiB

#include <cstddef>
#include <cstdint>
#include <vector>

#include "program.hxx"
#include "status.hxx"
#include "vm/cell.hxx"
#include "vm/memory.hxx"

namespace bft {

struct ProfileInfo {
    std::uint64_t instructions = 0;
    double seconds = 0.0;
};

struct VmOptions {
    // Log every executed instruction to std::cerr.
    bool trace = false;
    // Ask for input on std::cerr before each read.
    bool prompt = false;
    ProfileInfo* profile = nullptr;
};

}  // namespace bft

#include "vm/executor.hxx"
