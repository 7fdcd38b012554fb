#include <vector>
#include <cstdint>

#include "instruction.hpp"

// Counts 0..9 into the out0 port at 0x20000, then jumps past the end of the image.
std::vector<uint8_t> demo_program() {
    static constexpr uint64_t OUT0 = 0x20000;
    static constexpr uint64_t LOOP = 19;

    std::vector<uint8_t> p;
    emit(p, Op::LoadA, 0);                     // 00: A <- 0
    emit(p, Op::LoadB, 1);                     // 09: B <- 1
    emit(p, Op::CopyBS);                       // 18: S <- 1 (increment)
    // loop:
    emit(p, Op::PushABus, OUT0);               // 19: [OUT0] <- A
    emit(p, Op::CopySB);                       // 28: B <- S
    emit(p, Op::Add);                          // 29: A++
    emit(p, Op::LoadB, 10);                    // 30: B <- 10
    emit(p, Op::SkipGrEq);                     // 39: done when A >= 10
    emit(p, Op::LoadX, LOOP);                  // 40: back to the store
    emit(p, Op::LoadX, PROGRAM_BYTES);         // 49: halt: next fetch is out of instructions
    return p;
}
