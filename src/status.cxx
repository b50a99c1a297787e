#include "status.hxx"

#include <string>
#include <utility>

std::string bft::Status::message() const {
    switch (kind) {
        case ErrorKind::None:
            return "OK";
        case ErrorKind::UnmatchedClose:
            return "Unmatched close bracket";
        case ErrorKind::UnmatchedOpen:
            return "Unmatched open bracket";
        case ErrorKind::HeadOutOfBounds:
            return "Head fell off the tape";
        case ErrorKind::Io:
            return "I/O error";
    }
    return "Unknown error";
}

std::string bft::Status::describe(std::string_view name) const {
    std::string out(name);
    if (where) {
        out += ':';
        out += std::to_string(where->pos.line);
        out += ':';
        out += std::to_string(where->pos.column);
    }
    if (!out.empty()) out += ": ";
    out += message();
    if (where) {
        out += " (";
        out += actionName(where->op);
        out += ')';
    }
    if (!cause.empty()) {
        out += ": ";
        out += cause;
    }
    return out;
}

bft::Status bft::Status::unmatched(const instruction& ins) {
    Status s;
    s.kind = ins.op == insType::JMP_ZER ? ErrorKind::UnmatchedOpen : ErrorKind::UnmatchedClose;
    s.where = ins;
    return s;
}

bft::Status bft::Status::outOfBounds(const instruction& ins, bool beforeStart) {
    Status s;
    s.kind = ErrorKind::HeadOutOfBounds;
    s.where = ins;
    s.cause = beforeStart ? "cell pointer moved before start" : "cell pointer moved beyond end";
    return s;
}

bft::Status bft::Status::io(std::string cause, std::optional<instruction> ins) {
    Status s;
    s.kind = ErrorKind::Io;
    s.where = std::move(ins);
    s.cause = std::move(cause);
    return s;
}
