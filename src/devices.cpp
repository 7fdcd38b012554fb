#include "devices.hpp"
#include "errors.hpp"

uint64_t OutputPort::load(uint64_t /*addr*/) {
    return log_.empty() ? 0 : log_.back();
}

void OutputPort::store(uint64_t /*addr*/, uint64_t value) {
    log_.push_back(value);
    if (echo_) *echo_ << "[" << name_ << "] " << std::dec << value << "\n";
}

uint64_t RamDevice::load(uint64_t addr) {
    return cells_.at(addr - base_);
}

void RamDevice::store(uint64_t addr, uint64_t value) {
    if (read_only_)
        throw CpuError(Fault::DeviceFault, addr, "device '" + name_ + "' is read-only");
    cells_.at(addr - base_) = value;
}
