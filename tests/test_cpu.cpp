#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <memory>
#include <vector>

#include "cpu.hpp"
#include "devices.hpp"
#include "test_util.hpp"

extern std::vector<uint8_t> demo_program();

static constexpr uint64_t MAX = std::numeric_limits<uint64_t>::max();

// Runs a single operand-free instruction from the given register state.
static Registers run_one(Op op, Registers start) {
    std::vector<uint8_t> p;
    emit(p, op);
    auto m = make_machine(p);
    m->reg = start;
    m->reg.X = 0;
    m->tick();
    return m->reg;
}

// ---- scenarios ----

TEST(Cpu, LoadImmediateThenStore) {
    std::vector<uint8_t> p{12, 0,0,0,0,0,0,0,5, 10, 0,0,0,0,0,0,0,0};
    auto m = make_machine(p);
    m->tick();
    EXPECT_EQ(m->reg.A, 5u);
    EXPECT_EQ(m->reg.X, 9u);
    m->tick();
    EXPECT_EQ(m->mem[0], 5u);
    EXPECT_EQ(m->reg.X, 18u);
    EXPECT_EQ(m->ticks, 2u);
}

TEST(Cpu, AddZeros) {
    auto m = make_machine({3});
    m->tick();
    EXPECT_EQ(m->reg.A, 0u);
    EXPECT_EQ(m->reg.X, 1u);
}

TEST(Cpu, DivideByZero) {
    auto m = make_machine({6});
    m->reg.A = 42;
    try {
        m->tick();
        FAIL() << "divide by zero succeeded";
    } catch (const CpuError& e) {
        EXPECT_EQ(e.fault(), Fault::DivideByZero);
        EXPECT_EQ(e.where(), 0u);
    }
    EXPECT_EQ(m->reg.A, 42u);
    EXPECT_EQ(m->reg.X, 0u);
    EXPECT_EQ(m->ticks, 0u);
    EXPECT_TRUE(m->timeline.empty());
}

TEST(Cpu, RunsOffTheEnd) {
    auto m = make_machine({});
    m->reg.X = PROGRAM_BYTES;
    try {
        m->tick();
        FAIL() << "ticked past the end";
    } catch (const CpuError& e) {
        EXPECT_EQ(e.fault(), Fault::OutOfInstructions);
        EXPECT_EQ(e.where(), PROGRAM_BYTES);
    }
    EXPECT_EQ(m->reg.X, PROGRAM_BYTES);
}

TEST(Cpu, IllegalInstructionLeavesStateAlone) {
    auto m = make_machine({0, 0xFF});
    m->reg.A = 1; m->reg.B = 2; m->reg.S = 3;
    m->tick();
    EXPECT_EQ(m->reg.X, 1u);
    EXPECT_THROW(m->tick(), CpuError);
    EXPECT_EQ(m->reg.X, 1u);
    EXPECT_EQ(m->reg.A, 1u);
    EXPECT_EQ(m->reg.B, 2u);
    EXPECT_EQ(m->reg.S, 3u);
    EXPECT_EQ(m->ticks, 1u);
}

// ---- ALU ----

TEST(Alu, Arithmetic) {
    EXPECT_EQ(run_one(Op::Add,      {7, 5, 0, 0}).A, 12u);
    EXPECT_EQ(run_one(Op::Subtract, {7, 5, 0, 0}).A, 2u);
    EXPECT_EQ(run_one(Op::Multiply, {7, 5, 0, 0}).A, 35u);
    EXPECT_EQ(run_one(Op::Divide,   {7, 2, 0, 0}).A, 3u);
    EXPECT_EQ(run_one(Op::Divide,   {7, 2, 0, 0}).B, 2u);
}

TEST(Alu, Wraps) {
    EXPECT_EQ(run_one(Op::Add,      {MAX, 1, 0, 0}).A, 0u);
    EXPECT_EQ(run_one(Op::Add,      {MAX, MAX, 0, 0}).A, MAX - 1);
    EXPECT_EQ(run_one(Op::Subtract, {0, 1, 0, 0}).A, MAX);
    EXPECT_EQ(run_one(Op::Multiply, {1ull << 63, 2, 0, 0}).A, 0u);
    EXPECT_EQ(run_one(Op::Multiply, {MAX, MAX, 0, 0}).A, 1u);
}

TEST(Alu, CopiesAndSwaps) {
    const Registers s{1, 2, 3, 0};
    Registers r;

    r = run_one(Op::CopyAB, s); EXPECT_EQ(r.B, 1u); EXPECT_EQ(r.A, 1u);
    r = run_one(Op::CopyBA, s); EXPECT_EQ(r.A, 2u);
    r = run_one(Op::SwapAB, s); EXPECT_EQ(r.A, 2u); EXPECT_EQ(r.B, 1u);
    r = run_one(Op::CopyAS, s); EXPECT_EQ(r.S, 1u);
    r = run_one(Op::CopyBS, s); EXPECT_EQ(r.S, 2u);
    r = run_one(Op::CopySA, s); EXPECT_EQ(r.A, 3u);
    r = run_one(Op::CopySB, s); EXPECT_EQ(r.B, 3u);
    r = run_one(Op::SwapAS, s); EXPECT_EQ(r.A, 3u); EXPECT_EQ(r.S, 1u);
    r = run_one(Op::SwapBS, s); EXPECT_EQ(r.B, 3u); EXPECT_EQ(r.S, 2u);

    // X reads give the advanced pointer
    r = run_one(Op::CopyXA, s); EXPECT_EQ(r.A, 1u);
    r = run_one(Op::CopyXB, s); EXPECT_EQ(r.B, 1u);
    r = run_one(Op::CopyXS, s); EXPECT_EQ(r.S, 1u);

    // X writes are jumps
    r = run_one(Op::CopyAX, s); EXPECT_EQ(r.X, 1u);
    r = run_one(Op::CopyBX, s); EXPECT_EQ(r.X, 2u);
    r = run_one(Op::CopySX, s); EXPECT_EQ(r.X, 3u);

    r = run_one(Op::NoOp, s);
    EXPECT_EQ(r.A, 1u); EXPECT_EQ(r.B, 2u); EXPECT_EQ(r.S, 3u); EXPECT_EQ(r.X, 1u);
}

// ---- immediates and bus ops ----

TEST(Cpu, Immediates) {
    std::vector<uint8_t> p;
    emit(p, Op::LoadA, 0x1111);
    emit(p, Op::LoadB, 0x2222);
    emit(p, Op::LoadX, 100);
    auto m = make_machine(p);
    m->tick(); m->tick();
    EXPECT_EQ(m->reg.A, 0x1111u);
    EXPECT_EQ(m->reg.B, 0x2222u);
    m->tick();
    EXPECT_EQ(m->reg.X, 100u);
}

TEST(Cpu, AbsoluteLoadsAndStores) {
    std::vector<uint8_t> p;
    emit(p, Op::LoadBusA, 10);
    emit(p, Op::LoadBusB, 11);
    emit(p, Op::PushABus, 20);
    emit(p, Op::PushBBus, 21);
    emit(p, Op::PushXBus, 22);
    auto m = make_machine(p);
    m->mem[10] = 0xAAAA;
    m->mem[11] = 0xBBBB;
    for (int i = 0; i < 5; ++i) m->tick();
    EXPECT_EQ(m->reg.A, 0xAAAAu);
    EXPECT_EQ(m->reg.B, 0xBBBBu);
    EXPECT_EQ(m->mem[20], 0xAAAAu);
    EXPECT_EQ(m->mem[21], 0xBBBBu);
    EXPECT_EQ(m->mem[22], 45u);   // X after PushXBus was fetched
}

TEST(Cpu, LoadBusXJumps) {
    std::vector<uint8_t> p;
    emit(p, Op::LoadBusX, 5);
    auto m = make_machine(p);
    m->mem[5] = 300;
    m->tick();
    EXPECT_EQ(m->reg.X, 300u);
}

TEST(Cpu, StackRelative) {
    std::vector<uint8_t> p;
    emit(p, Op::LoadBusAS);
    emit(p, Op::LoadBusBS);
    emit(p, Op::PushABusS);   // writes back A at S (unchanged)
    auto m = make_machine(p);
    m->reg.S = 40;
    m->mem[40] = 9;
    m->tick(); m->tick();
    EXPECT_EQ(m->reg.A, 9u);
    EXPECT_EQ(m->reg.B, 9u);

    m->reg.A = 77;
    m->tick();
    EXPECT_EQ(m->mem[40], 77u);

    std::vector<uint8_t> q;
    emit(q, Op::PushBBusS);
    emit(q, Op::PushXBusS);
    emit(q, Op::LoadBusXS);
    auto n = make_machine(q);
    n->reg.B = 5;
    n->reg.S = 50;
    n->tick();
    EXPECT_EQ(n->mem[50], 5u);
    n->tick();
    EXPECT_EQ(n->mem[50], 2u);
    n->mem[50] = 1000;
    n->tick();
    EXPECT_EQ(n->reg.X, 1000u);
}

// ---- skips ----

struct SkipCase { Op op; uint64_t a, b; bool taken; };

TEST(Skip, Relations) {
    const SkipCase cases[] = {
        {Op::SkipEq,   3, 3, true},  {Op::SkipEq,   3, 4, false},
        {Op::SkipGrEq, 4, 3, true},  {Op::SkipGrEq, 3, 3, true},  {Op::SkipGrEq, 2, 3, false},
        {Op::SkipGr,   4, 3, true},  {Op::SkipGr,   3, 3, false},
        {Op::SkipLe,   2, 3, true},  {Op::SkipLe,   3, 3, false},
        {Op::SkipLeEq, 2, 3, true},  {Op::SkipLeEq, 3, 3, true},  {Op::SkipLeEq, 4, 3, false},
        {Op::SkipGr,   MAX, 0, true},   // unsigned compare
    };
    for (const auto& c : cases) {
        std::vector<uint8_t> p;
        emit(p, c.op);
        emit(p, Op::LoadA, 99);   // 9 bytes
        emit(p, Op::Add);
        auto m = make_machine(p);
        m->reg.A = c.a;
        m->reg.B = c.b;
        m->tick();
        EXPECT_EQ(m->reg.X, c.taken ? 10u : 1u) << mnemonic(c.op) << " " << c.a << " " << c.b;
        EXPECT_EQ(m->reg.A, c.a);
    }
}

TEST(Skip, OverOneByteInstruction) {
    std::vector<uint8_t> p;
    emit(p, Op::SkipEq);
    emit(p, Op::Add);
    emit(p, Op::CopyAB);
    auto m = make_machine(p);
    m->reg.A = 1; m->reg.B = 1;
    m->tick();
    EXPECT_EQ(m->reg.X, 2u);
    m->tick();
    EXPECT_EQ(m->reg.A, 1u);   // Add never ran
}

TEST(Skip, AtEndOfImage) {
    ProgramImage img{};
    img[PROGRAM_BYTES - 1] = static_cast<uint8_t>(Op::SkipEq);
    auto m = std::make_unique<Machine>(img);
    m->reg.X = PROGRAM_BYTES - 1;
    m->tick();
    EXPECT_EQ(m->reg.X, PROGRAM_BYTES + 1);
    try {
        m->tick();
        FAIL() << "ran past the end";
    } catch (const CpuError& e) {
        EXPECT_EQ(e.fault(), Fault::OutOfInstructions);
    }
}

TEST(Skip, IllegalTargetIsAtomic) {
    auto m = make_machine({static_cast<uint8_t>(Op::SkipEq), 0xEE});
    try {
        m->tick();
        FAIL() << "skipped an illegal opcode";
    } catch (const CpuError& e) {
        EXPECT_EQ(e.fault(), Fault::IllegalInstruction);
        EXPECT_EQ(e.where(), 1u);
    }
    EXPECT_EQ(m->reg.X, 0u);

    // not taken: the illegal byte is reached by the next tick instead
    m->reg.A = 1;
    m->tick();
    EXPECT_EQ(m->reg.X, 1u);
    EXPECT_THROW(m->tick(), CpuError);
}

// ---- address router ----

TEST(Router, MemoryRoundTrip) {
    auto m = make_machine({});
    for (uint64_t addr : {0ull, 1ull, 0x1234ull, 0xFFFFull}) {
        m->store(addr, MAX - addr);
        EXPECT_EQ(m->load(addr), MAX - addr);
        EXPECT_EQ(m->mem[addr], MAX - addr);
    }
}

TEST(Router, ProgramTruncation) {
    auto m = make_machine({});
    m->store(0x10000, 0x1234);
    EXPECT_EQ(m->load(0x10000), 0x34u);
    EXPECT_EQ(m->program[0], 0x34);
    m->store(0x1FFFF, 0xFFFFFFFFFFFFFF80ull);
    EXPECT_EQ(m->load(0x1FFFF), 0x80u);
    EXPECT_EQ(m->program[PROGRAM_BYTES - 1], 0x80);
}

TEST(Router, ProgramBytesReadZeroExtended) {
    auto m = make_machine({0xFF});
    EXPECT_EQ(m->load(Machine::PROGRAM_BASE), 0xFFu);
}

TEST(Router, Unmapped) {
    auto m = make_machine({});
    try {
        m->load(0x20000);
        FAIL() << "load from unmapped address";
    } catch (const CpuError& e) {
        EXPECT_EQ(e.fault(), Fault::IllegalAddressLoad);
        EXPECT_EQ(e.where(), 0x20000u);
    }
    try {
        m->store(MAX, 1);
        FAIL() << "store to unmapped address";
    } catch (const CpuError& e) {
        EXPECT_EQ(e.fault(), Fault::IllegalAddressStore);
        EXPECT_EQ(e.where(), MAX);
    }
}

TEST(Router, SelfModifyingProgram) {
    // overwrite the NoOp at offset 9 with Add through the program region
    std::vector<uint8_t> p;
    emit(p, Op::PushABus, Machine::PROGRAM_BASE + 9);
    emit(p, Op::NoOp);
    auto m = make_machine(p);
    m->reg.A = static_cast<uint64_t>(Op::CopyAB) | 0x100;   // high bits dropped
    m->tick();
    EXPECT_EQ(m->program[9], static_cast<uint8_t>(Op::CopyAB));
    m->tick();
    EXPECT_EQ(m->reg.B, m->reg.A);
}

TEST(Router, FailedStoreIsAtomic) {
    std::vector<uint8_t> p;
    emit(p, Op::PushABus, 0x50000);
    auto m = make_machine(p);
    m->reg.A = 3;
    try {
        m->tick();
        FAIL() << "store to unmapped address";
    } catch (const CpuError& e) {
        EXPECT_EQ(e.fault(), Fault::IllegalAddressStore);
        EXPECT_EQ(e.where(), 0x50000u);
    }
    EXPECT_EQ(m->reg.X, 0u);
    EXPECT_EQ(m->ticks, 0u);
    EXPECT_TRUE(m->timeline.empty());
}

TEST(Router, DeviceFaultIsAtomic) {
    std::vector<DevicePtr> devs;
    auto rom = std::make_unique<RamDevice>("rom", 0x40000, 16, true);
    rom->poke(0x40001, 123);
    devs.push_back(std::move(rom));

    std::vector<uint8_t> p;
    emit(p, Op::LoadBusB, 0x40001);
    emit(p, Op::PushBBus, 0x40002);
    auto m = make_machine(p, std::move(devs));
    m->tick();
    EXPECT_EQ(m->reg.B, 123u);
    try {
        m->tick();
        FAIL() << "store to read-only device";
    } catch (const CpuError& e) {
        EXPECT_EQ(e.fault(), Fault::DeviceFault);
        EXPECT_EQ(e.where(), 0x40002u);
    }
    EXPECT_EQ(m->reg.X, 9u);
}

// ---- trace ----

TEST(Trace, RecordsBusEvents) {
    std::vector<uint8_t> p;
    emit(p, Op::LoadA, 7);
    emit(p, Op::PushABus, 3);
    emit(p, Op::LoadBusB, 3);
    auto m = make_machine(p);
    for (int i = 0; i < 3; ++i) m->tick();

    ASSERT_EQ(m->timeline.size(), 3u);
    EXPECT_TRUE(m->timeline[0].events.empty());
    EXPECT_EQ(m->timeline[0].opcode, static_cast<uint8_t>(Op::LoadA));

    const TraceFrame& st = m->timeline[1];
    EXPECT_EQ(st.tick, 1u);
    EXPECT_EQ(st.pc, 9u);
    EXPECT_EQ(st.x, 18u);
    ASSERT_EQ(st.events.size(), 1u);
    EXPECT_EQ(st.events[0].dir, BusDir::Write);
    EXPECT_EQ(st.events[0].address, 3u);
    EXPECT_EQ(st.events[0].data, 7u);
    EXPECT_EQ(st.events[0].note, "PushABus");

    const TraceFrame& ld = m->timeline[2];
    ASSERT_EQ(ld.events.size(), 1u);
    EXPECT_EQ(ld.events[0].dir, BusDir::Read);
    EXPECT_EQ(ld.b, 7u);
}

TEST(Trace, Capacity) {
    std::vector<uint8_t> p(10, 0);
    auto m = make_machine(p);
    m->trace_capacity = 4;
    for (int i = 0; i < 10; ++i) m->tick();
    ASSERT_EQ(m->timeline.size(), 4u);
    EXPECT_EQ(m->timeline.front().tick, 6u);
    EXPECT_EQ(m->timeline.back().tick, 9u);

    m->trace_capacity = 0;
    m->timeline.clear();
    m->tick();
    EXPECT_TRUE(m->timeline.empty());
    EXPECT_EQ(m->ticks, 11u);
}

TEST(Trace, FramesStayAddressableByTickAfterTrimming) {
    std::vector<uint8_t> p;
    emit(p, Op::LoadA, 9);
    emit(p, Op::PushABus, 5);
    emit(p, Op::PushABus, 6);
    auto m = make_machine(p);
    m->trace_capacity = 2;
    m->tick(); m->tick();
    const TraceFrame* kept = nullptr;
    for (const auto& f : m->timeline)
        if (f.tick == 1) kept = &f;
    ASSERT_NE(kept, nullptr);

    m->tick();   // drops tick 0
    ASSERT_EQ(m->timeline.size(), 2u);
    const TraceFrame* again = nullptr;
    for (const auto& f : m->timeline)
        if (f.tick == 1) again = &f;
    ASSERT_NE(again, nullptr);
    ASSERT_EQ(again->events.size(), 1u);
    EXPECT_EQ(again->events[0].dir, BusDir::Write);
    EXPECT_EQ(again->events[0].address, 5u);
    EXPECT_EQ(again->events[0].data, 9u);
}

TEST(Cpu, ResetKeepsProgram) {
    std::vector<uint8_t> p;
    emit(p, Op::LoadA, 5);
    emit(p, Op::PushABus, 1);
    auto m = make_machine(p);
    m->tick(); m->tick();
    m->store(Machine::PROGRAM_BASE + 20, 0x11);
    m->reset();
    EXPECT_EQ(m->reg.A, 0u);
    EXPECT_EQ(m->reg.X, 0u);
    EXPECT_EQ(m->mem[1], 0u);
    EXPECT_EQ(m->ticks, 0u);
    EXPECT_TRUE(m->timeline.empty());
    EXPECT_EQ(m->program[0], static_cast<uint8_t>(Op::LoadA));
    EXPECT_EQ(m->program[20], 0x11);
}

TEST(Cpu, DemoProgramCountsToTen) {
    std::vector<DevicePtr> devs;
    auto out = std::make_unique<OutputPort>("out0", 0x20000);
    OutputPort* port = out.get();
    devs.push_back(std::move(out));
    auto m = make_machine(demo_program(), std::move(devs));

    int guard = 1000;
    try {
        while (guard--) m->tick();
        FAIL() << "demo did not finish";
    } catch (const CpuError& e) {
        EXPECT_EQ(e.fault(), Fault::OutOfInstructions);
    }
    std::vector<uint64_t> expected{0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
    EXPECT_EQ(port->log(), expected);
    EXPECT_EQ(m->reg.A, 10u);
    EXPECT_EQ(m->reg.X, PROGRAM_BYTES);
}

TEST(Cpu, Version) {
    EXPECT_STRNE(wordcpu_version(), "");
}
