#include "cpu.hpp"

#include <string>
#include <utility>

#ifndef WORDCPU_VERSION
#define WORDCPU_VERSION "0.0.0"
#endif

const char* wordcpu_version() { return WORDCPU_VERSION; }

Machine::Machine(const ProgramImage& image, std::vector<DevicePtr> devices)
    : program(image), bus(std::move(devices)) {}

void Machine::reset() {
    reg = Registers{};
    mem.fill(0);
    ticks = 0;
    timeline.clear();
}

uint64_t Machine::load(uint64_t addr) {
    if (addr < MEM_WORDS) return mem[addr];
    if (addr < PROGRAM_BASE + PROGRAM_BYTES) return program[addr - PROGRAM_BASE];   // zero-extended
    return bus.load(addr);
}

void Machine::store(uint64_t addr, uint64_t value) {
    if (addr < MEM_WORDS) { mem[addr] = value; return; }
    if (addr < PROGRAM_BASE + PROGRAM_BYTES) {
        program[addr - PROGRAM_BASE] = static_cast<uint8_t>(value & 0xFF);   // high bits dropped
        return;
    }
    bus.store(addr, value);
}

uint64_t Machine::read(uint64_t addr, std::vector<BusEvent>& ev, const char* note) {
    uint64_t v = load(addr);
    ev.push_back(BusEvent{ticks, BusDir::Read, addr, v, note});
    return v;
}

void Machine::write(uint64_t addr, uint64_t data, std::vector<BusEvent>& ev, const char* note) {
    store(addr, data);
    if (addr >= PROGRAM_BASE && addr < PROGRAM_BASE + PROGRAM_BYTES) data &= 0xFF;
    ev.push_back(BusEvent{ticks, BusDir::Write, addr, data, note});
}

// Encoded length of the instruction at pos, for the Skip* ops.
uint64_t Machine::skip_length(uint64_t pos) const {
    if (pos >= program.size()) return 1;   // next tick reports OutOfInstructions
    const uint8_t byte = program[pos];
    if (!is_valid_opcode(byte))
        throw CpuError(Fault::IllegalInstruction, pos,
                       std::to_string(byte) + " is not a valid instruction (skip target " +
                       std::to_string(pos) + ")");
    return 1 + operand_bytes(static_cast<Op>(byte));
}

void Machine::tick() {
    const uint64_t pc = reg.X;
    const Decoded d = decode(program, pc);

    // Work on a copy; commit only when every effect succeeded.
    Registers r = reg;
    r.X = pc + 1 + d.operand_bytes;

    std::vector<BusEvent> ev;
    execute(d.inst, pc, r, ev);

    reg = r;
    if (trace_capacity > 0) {
        timeline.push_back(TraceFrame{ticks, pc, static_cast<uint8_t>(d.inst.op),
                                      r.A, r.B, r.S, r.X, std::move(ev)});
        while (timeline.size() > trace_capacity) timeline.pop_front();
    }
    ticks++;
}

void Machine::execute(const Instruction& inst, uint64_t pc, Registers& r, std::vector<BusEvent>& ev) {
    const uint64_t imm = inst.operand;
    const char* note = mnemonic(inst.op);

    switch (inst.op) {
        case Op::NoOp: break;

        // immediates and absolute loads/stores
        case Op::LoadA:    r.A = imm; break;
        case Op::LoadB:    r.B = imm; break;
        case Op::LoadX:    r.X = imm; break;
        case Op::LoadBusA: r.A = read(imm, ev, note); break;
        case Op::LoadBusB: r.B = read(imm, ev, note); break;
        case Op::LoadBusX: r.X = read(imm, ev, note); break;
        case Op::PushABus: write(imm, r.A, ev, note); break;
        case Op::PushBBus: write(imm, r.B, ev, note); break;
        case Op::PushXBus: write(imm, r.X, ev, note); break;

        // ALU, wrapping modulo 2^64
        case Op::Add:      r.A = r.A + r.B; break;
        case Op::Subtract: r.A = r.A - r.B; break;
        case Op::Multiply: r.A = r.A * r.B; break;
        case Op::Divide:
            if (r.B == 0)
                throw CpuError(Fault::DivideByZero, pc, "Divide by zero at position " + std::to_string(pc));
            r.A = r.A / r.B;
            break;

        // register moves: CopyPQ is Q <- P
        case Op::CopyAB: r.B = r.A; break;
        case Op::CopyBA: r.A = r.B; break;
        case Op::CopyAX: r.X = r.A; break;
        case Op::CopyBX: r.X = r.B; break;
        case Op::CopyXA: r.A = r.X; break;
        case Op::CopyXB: r.B = r.X; break;
        case Op::CopyAS: r.S = r.A; break;
        case Op::CopyBS: r.S = r.B; break;
        case Op::CopyXS: r.S = r.X; break;
        case Op::CopySA: r.A = r.S; break;
        case Op::CopySB: r.B = r.S; break;
        case Op::CopySX: r.X = r.S; break;
        case Op::SwapAB: std::swap(r.A, r.B); break;
        case Op::SwapAS: std::swap(r.A, r.S); break;
        case Op::SwapBS: std::swap(r.B, r.S); break;

        // S as address register
        case Op::LoadBusAS: r.A = read(r.S, ev, note); break;
        case Op::LoadBusBS: r.B = read(r.S, ev, note); break;
        case Op::LoadBusXS: r.X = read(r.S, ev, note); break;
        case Op::PushABusS: write(r.S, r.A, ev, note); break;
        case Op::PushBBusS: write(r.S, r.B, ev, note); break;
        case Op::PushXBusS: write(r.S, r.X, ev, note); break;

        // compare A with B (unsigned) and step over the next instruction
        case Op::SkipEq:   if (r.A == r.B) r.X += skip_length(r.X); break;
        case Op::SkipGrEq: if (r.A >= r.B) r.X += skip_length(r.X); break;
        case Op::SkipGr:   if (r.A >  r.B) r.X += skip_length(r.X); break;
        case Op::SkipLe:   if (r.A <  r.B) r.X += skip_length(r.X); break;
        case Op::SkipLeEq: if (r.A <= r.B) r.X += skip_length(r.X); break;
    }
}
