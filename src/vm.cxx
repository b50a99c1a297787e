/*
    bft - A brainfuck tape interpreter
    VM implementation
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "vm.hxx"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <istream>
#include <ostream>
#include <string>

#include "ansi.hxx"

namespace bft {

template <typename CellT>
VirtualMachine<CellT>::VirtualMachine(size_t length, bool extensible, const Program& program,
                                      VmOptions options)
    : prog(program),
      cells(length ? length : BFT_DEFAULT_TAPE_SIZE, extensible),
      opts(options) {}

// The instruction under the cursor. Single operations may be called directly with the cursor
// past the end of the program, in which case a bare instruction of the given type stands in.
template <typename CellT>
instruction VirtualMachine<CellT>::current(insType fallback) const {
    if (pc < prog.size()) return prog[pc];
    return instruction{fallback, SourcePos{}, std::nullopt};
}

template <typename CellT>
Status VirtualMachine<CellT>::moveHeadRight() {
    if (headIdx + 1 >= cells.size()) {
        if (!cells.grow()) return Status::outOfBounds(current(insType::PTR_RGT), false);
    }
    ++headIdx;
    return Status::success();
}

template <typename CellT>
Status VirtualMachine<CellT>::moveHeadLeft() {
    if (headIdx == 0) return Status::outOfBounds(current(insType::PTR_LFT), true);
    --headIdx;
    return Status::success();
}

template <typename CellT>
void VirtualMachine<CellT>::incrementCell() noexcept {
    CellKind<CellT>::increment(cells[headIdx]);
}

template <typename CellT>
void VirtualMachine<CellT>::decrementCell() noexcept {
    CellKind<CellT>::decrement(cells[headIdx]);
}

template <typename CellT>
Status VirtualMachine<CellT>::readValue(std::istream& in) {
    if (opts.prompt) std::cerr << "Input a value: " << std::flush;
    const auto ch = in.get();
    if (ch == std::istream::traits_type::eof()) {
        return Status::io(in.bad() ? "failed to read input" : "unexpected end of input",
                          current(insType::RAD_CHR));
    }
    CellKind<CellT>::setValue(cells[headIdx], static_cast<uint8_t>(ch));
    return Status::success();
}

template <typename CellT>
Status VirtualMachine<CellT>::writeValue(std::ostream& out) {
    const uint8_t byte = CellKind<CellT>::getValue(cells[headIdx]);
    out.put(static_cast<char>(byte));
    out.flush();
    if (!out) return Status::io("failed to write output", current(insType::PUT_CHR));
    tail = byte;
    return Status::success();
}

template <typename CellT>
Status VirtualMachine<CellT>::startLoop() {
    if (!CellKind<CellT>::isZero(cells[headIdx])) return Status::success();
    const instruction ins = current(insType::JMP_ZER);
    if (!ins.partner) return Status::unmatched(ins);
    pc = *ins.partner;
    return Status::success();
}

template <typename CellT>
Status VirtualMachine<CellT>::endLoop() {
    if (CellKind<CellT>::isZero(cells[headIdx])) return Status::success();
    const instruction ins = current(insType::JMP_NOT_ZER);
    if (!ins.partner) return Status::unmatched(ins);
    pc = *ins.partner;
    return Status::success();
}

template <typename CellT>
Status VirtualMachine<CellT>::step(std::istream& in, std::ostream& out) {
    switch (prog[pc].op) {
        case insType::PTR_RGT:
            return moveHeadRight();
        case insType::PTR_LFT:
            return moveHeadLeft();
        case insType::INC:
            incrementCell();
            break;
        case insType::DEC:
            decrementCell();
            break;
        case insType::PUT_CHR:
            return writeValue(out);
        case insType::RAD_CHR:
            return readValue(in);
        case insType::JMP_ZER:
            return startLoop();
        case insType::JMP_NOT_ZER:
            return endLoop();
        case insType::NONE:
            break;
    }
    return Status::success();
}

template <typename CellT>
void VirtualMachine<CellT>::finish(std::ostream& out) {
    if (tail == '\n') return;
    out.put('\n');
    out.flush();
    if (!out) {
        std::cerr << ansi::yellow << "warning:" << ansi::reset
                  << " failed to write trailing newline" << std::endl;
    }
}

template <typename CellT>
Status VirtualMachine<CellT>::interpret(std::istream& in, std::ostream& out) {
    std::chrono::steady_clock::time_point start;
    if (opts.profile) {
        opts.profile->instructions = 0;
        start = std::chrono::steady_clock::now();
    }
    Status status;
    const size_t count = prog.size();
    while (pc < count) {
        if (opts.trace) {
            std::cerr << ansi::cyan << "trace:" << ansi::reset << ' ' << prog[pc].describe()
                      << '\n';
        }
        status = step(in, out);
        if (!status.ok()) break;
        if (opts.profile) ++opts.profile->instructions;
        ++pc;
    }
    finish(out);
    if (opts.profile)
        opts.profile->seconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return status;
}

template class VirtualMachine<uint8_t>;

}  // namespace bft
