// include/errors.hpp
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

enum class Fault {
    OutOfInstructions,   // X ran past the end of the program image
    IllegalInstruction,  // opcode byte not in the table
    IllegalAddressLoad,  // load from an unmapped address
    IllegalAddressStore, // store to an unmapped address
    DivideByZero,
    DeviceFault,         // a device rejected a load/store
    BusConflict          // bad device range at construction
};

const char* fault_name(Fault f);

class CpuError : public std::runtime_error {
public:
    CpuError(Fault f, uint64_t where, const std::string& msg)
        : std::runtime_error(msg), fault_(f), where_(where) {}

    Fault    fault() const { return fault_; }
    // offending position (decode faults) or address (bus faults)
    uint64_t where() const { return where_; }

private:
    Fault    fault_;
    uint64_t where_;
};
