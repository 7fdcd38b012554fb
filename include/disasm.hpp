// include/disasm.hpp
#pragma once
#include <cstdint>
#include <string>

#include "instruction.hpp"

// Encoded length of the instruction starting with `op`; unknown bytes count as 1 (.DB).
int instr_len(uint8_t op);

// One line: position, raw bytes, mnemonic/operand and an effect comment.
std::string disasm_one(const ProgramImage& program, uint64_t pc);

std::string hex8s(uint8_t v);
std::string hexaddr(uint64_t v);
std::string hex64s(uint64_t v);

// ASCII lowercase, used for REPL command words.
std::string lowercase(std::string s);
