#include "errors.hpp"

const char* fault_name(Fault f) {
    switch (f) {
        case Fault::OutOfInstructions:   return "OutOfInstructions";
        case Fault::IllegalInstruction:  return "IllegalInstruction";
        case Fault::IllegalAddressLoad:  return "IllegalAddressLoad";
        case Fault::IllegalAddressStore: return "IllegalAddressStore";
        case Fault::DivideByZero:        return "DivideByZero";
        case Fault::DeviceFault:         return "DeviceFault";
        case Fault::BusConflict:         return "BusConflict";
    }
    return "?";
}
