// include/devices.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "bus.hpp"

// Single-address output latch. Every store is logged (and echoed to `echo`
// when set); a load returns the last value written.
class OutputPort : public Device {
public:
    OutputPort(std::string name, uint64_t addr, std::ostream* echo = nullptr)
        : name_(std::move(name)), addr_(addr), echo_(echo) {}

    AddressRange address_range() const override { return {addr_, addr_}; }
    uint64_t     load(uint64_t addr) override;
    void         store(uint64_t addr, uint64_t value) override;
    const char*  name() const override { return name_.c_str(); }

    const std::vector<uint64_t>& log() const { return log_; }
    void clear() { log_.clear(); }

private:
    std::string name_;
    uint64_t    addr_;
    std::ostream* echo_;
    std::vector<uint64_t> log_;
};

// Block of words at [base, base + words - 1].
class RamDevice : public Device {
public:
    RamDevice(std::string name, uint64_t base, size_t words, bool read_only = false)
        : name_(std::move(name)), base_(base), cells_(words, 0), read_only_(read_only) {}

    AddressRange address_range() const override { return {base_, base_ + cells_.size() - 1}; }
    uint64_t     load(uint64_t addr) override;
    void         store(uint64_t addr, uint64_t value) override;   // throws when read-only
    const char*  name() const override { return name_.c_str(); }

    // host-side access, bypasses the read-only flag (used to preload ROMs)
    void poke(uint64_t addr, uint64_t value) { cells_.at(addr - base_) = value; }
    uint64_t peek(uint64_t addr) const { return cells_.at(addr - base_); }

private:
    std::string name_;
    uint64_t    base_;
    std::vector<uint64_t> cells_;
    bool        read_only_;
};
