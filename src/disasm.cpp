#include "disasm.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

std::string hex8s(uint8_t v)   { std::ostringstream o; o<<std::hex<<std::setfill('0')<<std::setw(2)<<int(v); return o.str(); }
std::string hexaddr(uint64_t v) { std::ostringstream o; o<<std::hex<<std::setfill('0')<<std::setw(4)<<v; return o.str(); }
std::string hex64s(uint64_t v) { std::ostringstream o; o<<std::hex<<std::setfill('0')<<std::setw(16)<<v; return o.str(); }

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return s;
}

int instr_len(uint8_t op) {
    if (!is_valid_opcode(op)) return 1; // treat as .DB
    return 1 + static_cast<int>(operand_bytes(static_cast<Op>(op)));
}

static std::string effect(Op op, uint64_t imm) {
    const std::string a = "[$" + hexaddr(imm) + "]";
    switch (op) {
        case Op::NoOp:      return "no-op";
        case Op::LoadBusA:  return "A <- " + a;
        case Op::LoadBusB:  return "B <- " + a;
        case Op::LoadBusX:  return "X <- " + a + " (jump)";
        case Op::PushABus:  return a + " <- A";
        case Op::PushBBus:  return a + " <- B";
        case Op::PushXBus:  return a + " <- X";
        case Op::LoadA:     return "A <- imm";
        case Op::LoadB:     return "B <- imm";
        case Op::LoadX:     return "X <- imm (jump)";
        case Op::Add:       return "A <- A + B";
        case Op::Subtract:  return "A <- A - B";
        case Op::Multiply:  return "A <- A * B";
        case Op::Divide:    return "A <- A / B";
        case Op::CopyAB:    return "B <- A";
        case Op::CopyBA:    return "A <- B";
        case Op::SwapAB:    return "A <-> B";
        case Op::CopyAX:    return "X <- A (jump)";
        case Op::CopyBX:    return "X <- B (jump)";
        case Op::CopyXA:    return "A <- X";
        case Op::CopyXB:    return "B <- X";
        case Op::CopyAS:    return "S <- A";
        case Op::CopyBS:    return "S <- B";
        case Op::CopyXS:    return "S <- X";
        case Op::CopySA:    return "A <- S";
        case Op::CopySB:    return "B <- S";
        case Op::CopySX:    return "X <- S (jump)";
        case Op::SwapAS:    return "A <-> S";
        case Op::SwapBS:    return "B <-> S";
        case Op::LoadBusAS: return "A <- [S]";
        case Op::LoadBusBS: return "B <- [S]";
        case Op::LoadBusXS: return "X <- [S] (jump)";
        case Op::PushABusS: return "[S] <- A";
        case Op::PushBBusS: return "[S] <- B";
        case Op::PushXBusS: return "[S] <- X";
        case Op::SkipEq:    return "skip next if A == B";
        case Op::SkipGrEq:  return "skip next if A >= B";
        case Op::SkipGr:    return "skip next if A > B";
        case Op::SkipLe:    return "skip next if A < B";
        case Op::SkipLeEq:  return "skip next if A <= B";
    }
    return "";
}

std::string disasm_one(const ProgramImage& program, uint64_t pc) {
    std::ostringstream out;
    if (pc >= program.size()) {
        out << hexaddr(pc) << ":  (end of program)";
        return out.str();
    }
    const uint8_t op = program[pc];
    int L = instr_len(op);
    if (pc + L > program.size()) L = 1;   // truncated operand, show as data

    // bytes column
    out << hexaddr(pc) << ":  ";
    for (int i = 0; i < 9; ++i) {
        if (i < L) out << hex8s(program[pc + i]) << ' ';
        else out << "   ";
    }
    out << "  ";

    if (!is_valid_opcode(op) || L != instr_len(op)) {
        out << std::left << std::setw(28) << (".DB $" + hex8s(op)) << "; data";
        return out.str();
    }

    const Op o = static_cast<Op>(op);
    uint64_t imm = 0;
    std::string text = mnemonic(o);
    if (L > 1) {
        for (int i = 1; i < L; ++i) imm = (imm << 8) | program[pc + i];
        text += " $" + hexaddr(imm);
    }
    out << std::left << std::setw(28) << text << "; " << effect(o, imm);
    return out.str();
}
