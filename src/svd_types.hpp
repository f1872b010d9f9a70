#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace edc2svd {

// CLR/SET/INV alias registers at +4/+8/+0xC
struct Portals {
    bool clr = false;
    bool set = false;
    bool inv = false;
};

struct Field {
    std::string   name;
    std::uint32_t startBit = 0;
    std::uint32_t stopBit  = 0;
};

// hasFields is false when the mode block carried no layout at all, which is
// not the same as a register whose layout holds only padding.
struct Register {
    std::string        name;
    std::string        description;
    std::uint32_t      addressOffset = 0;
    std::uint32_t      size          = 32;
    std::uint32_t      resetValue    = 0;
    bool               hasFields     = false;
    std::vector<Field> fields;
};

struct Peripheral {
    std::string           name;
    std::string           description;
    std::uint32_t         baseAddress = 0;
    std::vector<Register> registers;
};

struct Device {
    std::string             name;
    std::vector<Peripheral> peripherals;
};

}   // namespace edc2svd
