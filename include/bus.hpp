// include/bus.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

// Inclusive on both ends.
struct AddressRange {
    uint64_t min{0}, max{0};
    bool contains(uint64_t addr) const { return addr >= min && addr <= max; }
    bool overlaps(const AddressRange& o) const { return min <= o.max && o.min <= max; }
};

// A memory-mapped handler living above the built-in regions.
// load/store may throw; the bus reports any failure as Fault::DeviceFault.
class Device {
public:
    virtual ~Device() = default;

    virtual AddressRange address_range() const = 0;
    virtual uint64_t     load(uint64_t addr) = 0;
    virtual void         store(uint64_t addr, uint64_t value) = 0;
    virtual const char*  name() const { return "device"; }
};

using DevicePtr = std::unique_ptr<Device>;

class DeviceBus {
public:
    // Lowest address a device may claim; everything below is memory or program.
    static constexpr uint64_t DEVICE_BASE = 0x20000;

    DeviceBus() = default;
    // Throws CpuError(BusConflict) on inverted, low or overlapping ranges.
    explicit DeviceBus(std::vector<DevicePtr> devices);

    Device*  find(uint64_t addr) const;   // nullptr when unclaimed
    uint64_t load(uint64_t addr) const;
    void     store(uint64_t addr, uint64_t value) const;

    size_t        size() const { return devices_.size(); }
    const Device& device(size_t i) const { return *devices_.at(i); }

private:
    std::vector<DevicePtr> devices_;
};
