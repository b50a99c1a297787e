/*
    bft - A brainfuck tape interpreter
    Instruction model
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace bft {

enum class insType : uint8_t {
    PTR_RGT,
    PTR_LFT,
    INC,
    DEC,
    PUT_CHR,
    RAD_CHR,
    JMP_ZER,
    JMP_NOT_ZER,
    NONE,
};

// 1-based line and column of an instruction in its source text.
struct SourcePos {
    std::size_t line = 1;
    std::size_t column = 1;
};

struct instruction {
    insType op = insType::NONE;
    SourcePos pos{};
    // Index of the matching bracket in the program, only set on JMP_ZER / JMP_NOT_ZER.
    std::optional<std::size_t> partner{};

    bool isLoop() const noexcept { return op == insType::JMP_ZER || op == insType::JMP_NOT_ZER; }
    std::string describe() const;
};

inline constexpr std::array<insType, 256> charToOpcode = [] {
    std::array<insType, 256> table{};
    table.fill(insType::NONE);
    table[static_cast<unsigned char>('>')] = insType::PTR_RGT;
    table[static_cast<unsigned char>('<')] = insType::PTR_LFT;
    table[static_cast<unsigned char>('+')] = insType::INC;
    table[static_cast<unsigned char>('-')] = insType::DEC;
    table[static_cast<unsigned char>('.')] = insType::PUT_CHR;
    table[static_cast<unsigned char>(',')] = insType::RAD_CHR;
    table[static_cast<unsigned char>('[')] = insType::JMP_ZER;
    table[static_cast<unsigned char>(']')] = insType::JMP_NOT_ZER;
    return table;
}();

constexpr std::string_view actionName(insType op) noexcept {
    switch (op) {
        case insType::PTR_RGT:
            return "Increment current pointer";
        case insType::PTR_LFT:
            return "Decrement current pointer";
        case insType::INC:
            return "Increment current data";
        case insType::DEC:
            return "Decrement current data";
        case insType::PUT_CHR:
            return "Print out current data";
        case insType::RAD_CHR:
            return "Type into current data";
        case insType::JMP_ZER:
            return "Start looping";
        case insType::JMP_NOT_ZER:
            return "End looping";
        case insType::NONE:
            break;
    }
    return "Unknown";
}

constexpr char opcodeChar(insType op) noexcept {
    switch (op) {
        case insType::PTR_RGT:
            return '>';
        case insType::PTR_LFT:
            return '<';
        case insType::INC:
            return '+';
        case insType::DEC:
            return '-';
        case insType::PUT_CHR:
            return '.';
        case insType::RAD_CHR:
            return ',';
        case insType::JMP_ZER:
            return '[';
        case insType::JMP_NOT_ZER:
            return ']';
        case insType::NONE:
            break;
    }
    return '?';
}

}  // namespace bft
