// include/instruction.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

static constexpr size_t PROGRAM_BYTES = 65536;
using ProgramImage = std::array<uint8_t, PROGRAM_BYTES>;

enum class Op : uint8_t {
    NoOp      = 0,
    LoadBusA  = 1,  // A <- [imm]
    LoadBusB  = 2,  // B <- [imm]
    Add       = 3,
    Subtract  = 4,
    Multiply  = 5,
    Divide    = 6,
    CopyAB    = 7,  // B <- A
    CopyBA    = 8,  // A <- B
    SwapAB    = 9,
    PushABus  = 10, // [imm] <- A
    PushBBus  = 11, // [imm] <- B
    LoadA     = 12, // A <- imm
    LoadBusX  = 13, // X <- [imm]
    CopyAX    = 14, // X <- A
    CopyBX    = 15, // X <- B
    PushXBus  = 16, // [imm] <- X
    LoadX     = 17, // X <- imm
    CopyXA    = 18, // A <- X
    CopyXB    = 19, // B <- X
    LoadBusAS = 20, // A <- [S]
    LoadBusBS = 21, // B <- [S]
    CopyAS    = 22, // S <- A
    CopyBS    = 23, // S <- B
    CopyXS    = 24, // S <- X
    CopySA    = 25, // A <- S
    CopySB    = 26, // B <- S
    CopySX    = 27, // X <- S
    SwapAS    = 28,
    SwapBS    = 29,
    PushABusS = 30, // [S] <- A
    PushBBusS = 31, // [S] <- B
    LoadBusXS = 32, // X <- [S]
    PushXBusS = 33, // [S] <- X
    SkipEq    = 34,
    SkipGrEq  = 35,
    SkipGr    = 36,
    SkipLe    = 37,
    SkipLeEq  = 38,
    LoadB     = 39, // B <- imm
};

static constexpr uint8_t OP_LAST = 39;
static constexpr size_t  OPERAND_BYTES = 8;

struct Instruction {
    Op       op{Op::NoOp};
    uint64_t operand{0};   // only meaningful when operand_bytes(op) != 0
};

struct Decoded {
    Instruction inst;
    size_t      operand_bytes{0};   // bytes consumed after the opcode
};

bool        is_valid_opcode(uint8_t byte);
size_t      operand_bytes(Op op);
const char* mnemonic(Op op);

// Decode the instruction whose opcode sits at program[pc].
// Throws CpuError (OutOfInstructions / IllegalInstruction). Never mutates.
Decoded decode(const ProgramImage& program, uint64_t pc);

// Encoding helpers; operands are written big-endian.
void emit(std::vector<uint8_t>& out, Op op);
void emit(std::vector<uint8_t>& out, Op op, uint64_t operand);
