#pragma once

#include <xxhash.h>

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "vm.hxx"

inline std::uint64_t hashOutput(std::string_view s) { return XXH64(s.data(), s.size(), 0); }

struct RunResult {
    bft::Status status;
    std::string output;
    size_t head = 0;
    std::vector<uint8_t> cells;
};

// Parses and runs 'code' on a fresh 8-bit VM with in-memory streams. Does not validate.
inline RunResult run(std::string_view code, const std::string& input = "", size_t tapeSize = 1000,
                     bool extensible = false, bft::VmOptions options = {}) {
    const bft::Program program("test", code);
    std::istringstream in(input);
    std::ostringstream out;
    bft::VirtualMachine<uint8_t> vm(tapeSize, extensible, program, options);
    RunResult result;
    result.status = vm.interpret(in, out);
    result.output = out.str();
    result.head = vm.head();
    result.cells = vm.tape().data();
    return result;
}
