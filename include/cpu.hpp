// include/cpu.hpp
#pragma once
#include <cstdint>
#include <array>
#include <deque>
#include <vector>

#include "bus.hpp"
#include "errors.hpp"
#include "instruction.hpp"
#include "trace.hpp"

struct Registers {
    uint64_t A{0};   // accumulator
    uint64_t B{0};   // operand
    uint64_t S{0};   // stack / pointer, address register for the *S ops
    uint64_t X{0};   // program counter: offset of the next opcode byte
};

struct Machine {
    // Address map
    static constexpr size_t   MEM_WORDS    = 65536;     // 0x00000..0x0FFFF -> mem
    static constexpr uint64_t PROGRAM_BASE = 0x10000;   // 0x10000..0x1FFFF -> program bytes
    static constexpr uint64_t DEVICE_BASE  = DeviceBus::DEVICE_BASE;

    Registers reg;

    // Memory
    std::array<uint64_t, MEM_WORDS> mem{};
    ProgramImage program{};
    DeviceBus    bus;

    // Accounting / debug view
    uint64_t ticks{0};                 // successfully executed instructions
    size_t   trace_capacity{4096};     // 0 disables the timeline
    std::deque<TraceFrame> timeline;

    // Throws CpuError(BusConflict) when the device ranges are unusable.
    explicit Machine(const ProgramImage& image, std::vector<DevicePtr> devices = {});

    // Zero registers, memory, counters and trace. The program image is kept.
    void reset();

    // One fetch-decode-execute step. Throws CpuError; a failed tick changes nothing.
    void tick();

    // Address router, also usable by the host between ticks.
    uint64_t load(uint64_t addr);
    void     store(uint64_t addr, uint64_t value);

private:
    void     execute(const Instruction& inst, uint64_t pc, Registers& r, std::vector<BusEvent>& ev);
    uint64_t skip_length(uint64_t pos) const;
    uint64_t read(uint64_t addr, std::vector<BusEvent>& ev, const char* note);
    void     write(uint64_t addr, uint64_t data, std::vector<BusEvent>& ev, const char* note);
};

const char* wordcpu_version();
