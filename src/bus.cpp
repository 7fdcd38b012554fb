#include "bus.hpp"
#include "errors.hpp"

#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

static std::string hexaddr(uint64_t v) {
    std::ostringstream o;
    o << "0x" << std::hex << std::setfill('0') << std::setw(5) << v;
    return o.str();
}

static std::string describe(const Device& d) {
    const AddressRange r = d.address_range();
    return std::string("'") + d.name() + "' [" + hexaddr(r.min) + ".." + hexaddr(r.max) + "]";
}

DeviceBus::DeviceBus(std::vector<DevicePtr> devices) : devices_(std::move(devices)) {
    for (size_t i = 0; i < devices_.size(); ++i) {
        if (!devices_[i])
            throw CpuError(Fault::BusConflict, 0, "device slot " + std::to_string(i) + " is empty");
        const AddressRange r = devices_[i]->address_range();
        if (r.min > r.max)
            throw CpuError(Fault::BusConflict, r.min,
                           "device " + describe(*devices_[i]) + " has an inverted range");
        if (r.min < DEVICE_BASE)
            throw CpuError(Fault::BusConflict, r.min,
                           "device " + describe(*devices_[i]) + " reaches below " + hexaddr(DEVICE_BASE));
        for (size_t j = 0; j < i; ++j) {
            if (r.overlaps(devices_[j]->address_range()))
                throw CpuError(Fault::BusConflict, r.min,
                               "device " + describe(*devices_[i]) + " overlaps " + describe(*devices_[j]));
        }
    }
}

Device* DeviceBus::find(uint64_t addr) const {
    for (const auto& d : devices_)
        if (d->address_range().contains(addr)) return d.get();
    return nullptr;
}

uint64_t DeviceBus::load(uint64_t addr) const {
    Device* d = find(addr);
    if (!d)
        throw CpuError(Fault::IllegalAddressLoad, addr, hexaddr(addr) + " is not a populated address");
    try {
        return d->load(addr);
    } catch (const CpuError&) {
        throw;
    } catch (const std::exception& e) {
        throw CpuError(Fault::DeviceFault, addr,
                       std::string("device '") + d->name() + "' failed load at " + hexaddr(addr) + ": " + e.what());
    }
}

void DeviceBus::store(uint64_t addr, uint64_t value) const {
    Device* d = find(addr);
    if (!d)
        throw CpuError(Fault::IllegalAddressStore, addr, hexaddr(addr) + " is not a populated address");
    try {
        d->store(addr, value);
    } catch (const CpuError&) {
        throw;
    } catch (const std::exception& e) {
        throw CpuError(Fault::DeviceFault, addr,
                       std::string("device '") + d->name() + "' failed store at " + hexaddr(addr) + ": " + e.what());
    }
}
