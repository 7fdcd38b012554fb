// src/main.cpp
#include <iostream>
#include <iomanip>
#include <sstream>
#include <vector>
#include <unordered_set>
#include <cstdint>
#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

#include "cpu.hpp"
#include "devices.hpp"
#include "disasm.hpp"
#include "loader.hpp"

extern std::vector<uint8_t> demo_program();

static constexpr uint64_t OUT0_ADDR = 0x20000;
static constexpr uint64_t RAM_BASE  = 0x30000;
static constexpr size_t   RAM_WORDS = 4096;

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static bool load_image_file(const std::string& path, std::vector<uint8_t>& out) {
    if (ends_with(path, ".hex")) return read_file_hexbytes(path, out);
    return read_file_binary(path, out);
}

static void disasm_range(const Machine& c, uint64_t start, int count_instrs) {
    uint64_t pc = start;
    for (int i = 0; i < count_instrs && pc < c.program.size(); ++i) {
        std::cout << disasm_one(c.program, pc) << "\n";
        pc += instr_len(c.program[pc]);
    }
}

static void print_regs(const Machine& c){
    std::cout << "X="<<hexaddr(c.reg.X)
              << "  A="<<hex64s(c.reg.A)
              << "  B="<<hex64s(c.reg.B)
              << "  S="<<hex64s(c.reg.S)
              << "  ticks="<<std::dec<<c.ticks << "\n";
}

// Routed word dump: works on memory, program bytes and devices alike.
static void dump_mem(Machine& c, uint64_t base, int rows=8, int cols=4){
    for(int r=0;r<rows;r++){
        uint64_t addr = base + (uint64_t)r*cols;
        std::cout<<hexaddr(addr)<<": ";
        for(int ccol=0;ccol<cols;ccol++){
            try {
                std::cout<<hex64s(c.load(addr+ccol))<<' ';
            } catch (const CpuError&) {
                std::cout<<std::string(16, '-')<<' ';
            }
        }
        std::cout<<"\n";
    }
}

// Print the last K trace frames (tick-by-tick bus view)
static void print_trace(const Machine& c, int k){
    if(c.timeline.empty()){ std::cout<<"(no trace yet)\n"; return; }
    int start = (int)std::max(0, (int)c.timeline.size()-k);
    for(int i=start;i<(int)c.timeline.size();++i){
        const auto& t = c.timeline[i];
        std::cout<< std::dec << t.tick << "  "
                 << hexaddr(t.pc) << "  "
                 << std::left << std::setw(10) << mnemonic(static_cast<Op>(t.opcode)) << std::right
                 << hex64s(t.a) << " " << hex64s(t.b) << " " << hex64s(t.s) << " " << hexaddr(t.x)
                 << "  events:" << t.events.size() << "\n";
        for(const auto& e: t.events){
            std::cout<<"    " << (e.dir==BusDir::Read? "RD":"WR")
                     <<" ["<<hexaddr(e.address)<<"] = "<<hex64s(e.data)
                     <<"  " << e.note << "\n";
        }
    }
}

// One tick; reports the fault and returns false when the machine stops.
static bool step(Machine& c){
    try {
        c.tick();
        return true;
    } catch (const CpuError& e) {
        if (e.fault() == Fault::OutOfInstructions)
            std::cout << "[done] program finished: " << e.what() << "\n";
        else
            std::cout << "[fault] " << fault_name(e.fault()) << ": " << e.what() << "\n";
        return false;
    }
}

int main(int argc, char** argv){
    if (argc > 2) {
        std::cout << "usage: " << argv[0] << " [IMAGE.bin|IMAGE.hex]\n";
        return 1;
    }

    std::vector<uint8_t> bytes;
    if (argc == 2) {
        if (!load_image_file(argv[1], bytes)) {
            std::cout << "could not load '" << argv[1] << "'\n";
            return 1;
        }
    } else {
        bytes = demo_program();
    }

    std::unique_ptr<Machine> cpu;
    auto out0 = std::make_unique<OutputPort>("out0", OUT0_ADDR, &std::cout);
    OutputPort* port = out0.get();
    try {
        std::vector<DevicePtr> devices;
        devices.push_back(std::move(out0));
        devices.push_back(std::make_unique<RamDevice>("ram", RAM_BASE, RAM_WORDS));
        cpu = std::make_unique<Machine>(make_image(bytes), std::move(devices));
    } catch (const std::exception& e) {
        std::cout << "could not build machine: " << e.what() << "\n";
        return 1;
    }

    std::unordered_set<uint64_t> breakpoints;

    std::cout << "wordcpu " << wordcpu_version() << " (CLI)\n";
    std::cout << "Type 'help' for commands.\n\n";
    print_regs(*cpu);

    std::string line;
    while (true){
        std::cout << "\n> " << std::flush;
        if(!std::getline(std::cin, line)) break;

        std::istringstream iss(line);
        std::string cmd; iss >> cmd;
        if(cmd.empty()) continue;

        // normalize lowercase
        cmd = lowercase(cmd);

        try {
        if(cmd=="q" || cmd=="quit" || cmd=="exit"){
            break;
        }
        else if(cmd=="help" || cmd=="h" || cmd=="?"){
            std::cout <<
R"(Commands:
  s                 step one instruction
  r N               run N instructions
  g                 run until fault, end of program or breakpoint
  p                 print registers
  m ADDR [ROWS]     dump words from hex ADDR through the address router (default 8 rows of 4)
  w ADDR VALUE      store VALUE at ADDR (both hex) through the address router
  b ADDR            add breakpoint at X==ADDR (hex)
  bl                list breakpoints
  bc [ADDR]         clear breakpoint at ADDR or all if none
  t [K]             show last K trace frames (default 20)
  d ADDR [N]        disassemble N instructions starting at program offset ADDR
  loadhex PATH [ADDR]   load hex bytes from PATH into the program at offset ADDR (default 0)
  loadbin PATH [ADDR]   load a binary file from PATH into the program at offset ADDR (default 0)
  out               show values written to out0
  reset             zero registers and memory, clear trace
  sleep MS          sleep for MS milliseconds
  help              this text
  quit              exit
)";
        }
        else if(cmd=="s"){
            step(*cpu);
            print_regs(*cpu);
        }
        else if(cmd=="r"){
            int n=0; iss>>n; if(n<=0) n=1;
            for(int i=0;i<n;i++){
                if(!step(*cpu)) break;
                if(breakpoints.count(cpu->reg.X)) { std::cout<<"* Breakpoint hit at X="<<hexaddr(cpu->reg.X)<<"\n"; break; }
            }
            print_regs(*cpu);
        }
        else if(cmd=="g"){
            int watchdog = 10'000'000;
            while(watchdog-- && step(*cpu)){
                if(breakpoints.count(cpu->reg.X)) { std::cout<<"* Breakpoint hit at X="<<hexaddr(cpu->reg.X)<<"\n"; break; }
            }
            print_regs(*cpu);
        }
        else if(cmd=="p"){
            print_regs(*cpu);
        }
        else if(cmd=="m"){
            std::string saddr; int rows=8; iss>>saddr>>rows;
            if(saddr.empty()){ std::cout<<"usage: m ADDR [ROWS]\n"; continue; }
            dump_mem(*cpu, std::stoull(saddr, nullptr, 16), rows);
        }
        else if(cmd=="w"){
            std::string saddr, sval; iss>>saddr>>sval;
            if(saddr.empty()||sval.empty()){ std::cout<<"usage: w ADDR VALUE\n"; continue; }
            uint64_t addr = std::stoull(saddr, nullptr, 16);
            uint64_t val  = std::stoull(sval, nullptr, 16);
            try {
                cpu->store(addr, val);
                std::cout<<"Wrote "<<hex64s(val)<<" to ["<<hexaddr(addr)<<"]\n";
            } catch (const CpuError& e) {
                std::cout<<"[fault] "<<fault_name(e.fault())<<": "<<e.what()<<"\n";
            }
        }
        else if(cmd=="b"){
            std::string saddr; iss>>saddr;
            if(saddr.empty()){ std::cout<<"usage: b ADDR\n"; continue; }
            uint64_t addr = std::stoull(saddr, nullptr, 16);
            breakpoints.insert(addr);
            std::cout<<"Breakpoint added at X="<<hexaddr(addr)<<"\n";
        }
        else if(cmd=="bl"){
            if(breakpoints.empty()) std::cout<<"(no breakpoints)\n";
            for(auto pc: breakpoints) std::cout<<" - "<<hexaddr(pc)<<"\n";
        }
        else if(cmd=="bc"){
            std::string saddr; iss>>saddr;
            if(saddr.empty()){ breakpoints.clear(); std::cout<<"Breakpoints cleared.\n"; }
            else {
                uint64_t addr = std::stoull(saddr, nullptr, 16);
                breakpoints.erase(addr);
                std::cout<<"Cleared "<<hexaddr(addr)<<"\n";
            }
        }
        else if(cmd=="t"){
            int k=20; iss>>k; if(k<=0) k=20;
            print_trace(*cpu, k);
        }
        else if(cmd=="reset"){
            cpu->reset();
            port->clear();
            std::cout<<"Reset done.\n";
            print_regs(*cpu);
        }
        else if(cmd=="sleep"){
            int ms=0; iss>>ms; if(ms>0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        }
        else if (cmd=="d" || cmd=="dis" || cmd=="disasm") {
            std::string saddr; int n = 16;
            iss >> saddr >> n;
            if (saddr.empty()) {
                std::cout << "usage: d <ADDR-hex> [N-instr]\n";
                continue;
            }
            if (n <= 0) n = 16;
            disasm_range(*cpu, std::stoull(saddr, nullptr, 16), n);
        }
        else if (cmd=="out") {
            if (port->log().empty()) std::cout << "(nothing written to out0)\n";
            for (auto v : port->log()) std::cout << std::dec << v << " ";
            if (!port->log().empty()) std::cout << "\n";
        }
        else if (cmd=="loadbin" || cmd=="loadhex") {
            std::string path, saddr; iss >> path >> saddr;
            if(path.empty()){ std::cout<<"usage: "<<cmd<<" <path> [addr-hex]\n"; continue; }
            size_t base = saddr.empty() ? 0 : (size_t)std::stoul(saddr, nullptr, 16);
            std::vector<uint8_t> buf;
            bool ok = cmd=="loadbin" ? read_file_binary(path, buf) : read_file_hexbytes(path, buf);
            if(!ok) { std::cout<<"["<<cmd<<"] failed to read '"<<path<<"'\n"; continue; }
            if(base > cpu->program.size() || buf.size() > cpu->program.size() - base) {
                std::cout<<"["<<cmd<<"] data too large for program at "<<hexaddr(base)<<"\n";
                continue;
            }
            std::copy(buf.begin(), buf.end(), cpu->program.begin() + base);
            std::cout<<"["<<cmd<<"] loaded "<<std::dec<<buf.size()<<" bytes at "<<hexaddr(base)<<"\n";
        }
        else {
            std::cout<<"Unknown command. Type 'help'.\n";
        }
        } catch (const std::exception& e) {
            // bad numeric argument from stoul/stoull
            std::cout<<"bad argument: "<<e.what()<<"\n";
        }
    }

    return 0;
}
