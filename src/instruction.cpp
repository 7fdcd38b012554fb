#include "instruction.hpp"
#include "errors.hpp"

#include <string>

bool is_valid_opcode(uint8_t byte) {
    return byte <= OP_LAST;
}

size_t operand_bytes(Op op) {
    switch (op) {
        case Op::LoadBusA:
        case Op::LoadBusB:
        case Op::PushABus:
        case Op::PushBBus:
        case Op::LoadA:
        case Op::LoadB:
        case Op::LoadBusX:
        case Op::PushXBus:
        case Op::LoadX:
            return OPERAND_BYTES;
        default:
            return 0;
    }
}

const char* mnemonic(Op op) {
    switch (op) {
        case Op::NoOp:      return "NoOp";
        case Op::LoadBusA:  return "LoadBusA";
        case Op::LoadBusB:  return "LoadBusB";
        case Op::Add:       return "Add";
        case Op::Subtract:  return "Subtract";
        case Op::Multiply:  return "Multiply";
        case Op::Divide:    return "Divide";
        case Op::CopyAB:    return "CopyAB";
        case Op::CopyBA:    return "CopyBA";
        case Op::SwapAB:    return "SwapAB";
        case Op::PushABus:  return "PushABus";
        case Op::PushBBus:  return "PushBBus";
        case Op::LoadA:     return "LoadA";
        case Op::LoadBusX:  return "LoadBusX";
        case Op::CopyAX:    return "CopyAX";
        case Op::CopyBX:    return "CopyBX";
        case Op::PushXBus:  return "PushXBus";
        case Op::LoadX:     return "LoadX";
        case Op::CopyXA:    return "CopyXA";
        case Op::CopyXB:    return "CopyXB";
        case Op::LoadBusAS: return "LoadBusAS";
        case Op::LoadBusBS: return "LoadBusBS";
        case Op::CopyAS:    return "CopyAS";
        case Op::CopyBS:    return "CopyBS";
        case Op::CopyXS:    return "CopyXS";
        case Op::CopySA:    return "CopySA";
        case Op::CopySB:    return "CopySB";
        case Op::CopySX:    return "CopySX";
        case Op::SwapAS:    return "SwapAS";
        case Op::SwapBS:    return "SwapBS";
        case Op::PushABusS: return "PushABusS";
        case Op::PushBBusS: return "PushBBusS";
        case Op::LoadBusXS: return "LoadBusXS";
        case Op::PushXBusS: return "PushXBusS";
        case Op::SkipEq:    return "SkipEq";
        case Op::SkipGrEq:  return "SkipGrEq";
        case Op::SkipGr:    return "SkipGr";
        case Op::SkipLe:    return "SkipLe";
        case Op::SkipLeEq:  return "SkipLeEq";
        case Op::LoadB:     return "LoadB";
    }
    return "?";
}

Decoded decode(const ProgramImage& program, uint64_t pc) {
    if (pc >= program.size())
        throw CpuError(Fault::OutOfInstructions, pc,
                       "Out of instructions at position " + std::to_string(pc));

    const uint8_t byte = program[pc];
    if (!is_valid_opcode(byte))
        throw CpuError(Fault::IllegalInstruction, pc,
                       std::to_string(byte) + " is not a valid instruction (position " +
                       std::to_string(pc) + ")");

    Decoded d;
    d.inst.op = static_cast<Op>(byte);
    d.operand_bytes = operand_bytes(d.inst.op);
    if (d.operand_bytes == 0) return d;

    // operand must fit entirely inside the image
    const uint64_t start = pc + 1;
    if (start + d.operand_bytes > program.size())
        throw CpuError(Fault::OutOfInstructions, start,
                       "Out of instructions reading operand of " +
                       std::string(mnemonic(d.inst.op)) + " at position " + std::to_string(start));

    uint64_t v = 0;
    for (size_t i = 0; i < d.operand_bytes; ++i)
        v = (v << 8) | program[start + i];
    d.inst.operand = v;
    return d;
}

void emit(std::vector<uint8_t>& out, Op op) {
    out.push_back(static_cast<uint8_t>(op));
}

void emit(std::vector<uint8_t>& out, Op op, uint64_t operand) {
    out.push_back(static_cast<uint8_t>(op));
    for (int shift = 56; shift >= 0; shift -= 8)
        out.push_back(static_cast<uint8_t>((operand >> shift) & 0xFF));
}
