// include/trace.hpp
#pragma once
#include <cstdint>
#include <string>
#include <vector>

enum class BusDir { Read, Write };

struct BusEvent {
    uint64_t tick;         // tick number the access belongs to
    BusDir   dir;          // memory direction
    uint64_t address;      // routed address
    uint64_t data;         // word transferred (program region: the byte)
    std::string note;      // e.g., "LoadBusA", "PushABusS"
};

struct TraceFrame {
    // Snapshot after each successful tick
    uint64_t tick;
    uint64_t pc;           // position of the opcode byte
    uint8_t  opcode;
    uint64_t a, b, s, x;   // registers after execution
    std::vector<BusEvent> events; // loads/stores performed by the instruction
};
