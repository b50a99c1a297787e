/*
    bft - A brainfuck tape interpreter
    Program parser
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "program.hxx"

#include <cstddef>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "source.hxx"

std::string bft::instruction::describe() const {
    std::string out = std::to_string(pos.line);
    out += ':';
    out += std::to_string(pos.column);
    out += ' ';
    out += actionName(op);
    return out;
}

bft::Program::Program(std::string name, std::string_view source) : filename(std::move(name)) {
    code.reserve(source.size());
    std::vector<size_t> stack;
    size_t line = 1;
    size_t column = 1;
    for (const char ch : source) {
        const insType op = charToOpcode[static_cast<unsigned char>(ch)];
        if (op != insType::NONE) {
            const size_t index = code.size();
            code.push_back(instruction{op, SourcePos{line, column}, std::nullopt});
            if (op == insType::JMP_ZER) {
                stack.push_back(index);
            } else if (op == insType::JMP_NOT_ZER && !stack.empty()) {
                const size_t start = stack.back();
                stack.pop_back();
                code[start].partner = index;
                code[index].partner = start;
            }
        }
        if (ch == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
    code.shrink_to_fit();
}

bft::Status bft::Program::fromFile(const std::string& path, Program& out) {
    std::string text;
    std::string err;
    if (!readSourceFile(path, text, err)) return Status::io(std::move(err));
    out = Program(path, text);
    return Status::success();
}

bft::Status bft::Program::validate() const {
    for (const auto& ins : code) {
        if (ins.isLoop() && !ins.partner) return Status::unmatched(ins);
    }
    return Status::success();
}

void bft::Program::listing(std::ostream& out) const {
    for (const auto& ins : code) {
        out << filename << ": " << ins.describe() << '\n';
    }
    out.flush();
}
