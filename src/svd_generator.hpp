#pragma once

#include "fmt_wrapper.hpp"
#include "svd_types.hpp"

#include <cstdint>
#include <ostream>
#include <pugixml.hpp>
#include <sstream>
#include <string>

namespace Generator { namespace Svd {

    inline pugi::xml_node appendText(pugi::xml_node&    parent,
                                     char const*        name,
                                     std::string const& text) {
        auto node = parent.append_child(name);
        node.text().set(text.c_str());
        return node;
    }

    inline pugi::xml_node appendText(pugi::xml_node& parent,
                                     char const*     name,
                                     std::uint32_t   value) {
        auto node = parent.append_child(name);
        node.text().set(value);
        return node;
    }

    inline std::string hex(std::uint32_t value) { return fmt::format("0x{:x}", value); }

    inline void appendRegister(pugi::xml_node&          registers,
                               edc2svd::Register const& reg) {
        auto node = registers.append_child("register");
        appendText(node, "name", reg.name);
        appendText(node, "description", reg.description);
        appendText(node, "addressOffset", hex(reg.addressOffset));
        appendText(node, "size", reg.size);
        appendText(node, "resetValue", reg.resetValue);

        if(!reg.hasFields) {
            return;
        }
        auto fields = node.append_child("fields");
        for(auto const& field : reg.fields) {
            auto fieldNode = fields.append_child("field");
            appendText(fieldNode, "name", field.name);
            appendText(fieldNode, "bitRange", fmt::format("[{}:{}]", field.stopBit, field.startBit));
        }
    }

    inline void appendPeripheral(pugi::xml_node&            peripherals,
                                 edc2svd::Peripheral const& peripheral) {
        auto node = peripherals.append_child("peripheral");
        appendText(node, "name", peripheral.name);
        appendText(node, "description", peripheral.description);
        appendText(node, "baseAddress", hex(peripheral.baseAddress));
        auto registers = node.append_child("registers");
        for(auto const& reg : peripheral.registers) {
            appendRegister(registers, reg);
        }
    }

    inline void SvdFromDevice(edc2svd::Device const& device,
                              pugi::xml_document&    doc) {
        auto declaration = doc.append_child(pugi::node_declaration);
        declaration.append_attribute("version").set_value("1.0");
        declaration.append_attribute("encoding").set_value("utf-8");

        auto root = doc.append_child("device");
        appendText(root, "name", device.name);
        auto peripherals = root.append_child("peripherals");
        for(auto const& peripheral : device.peripherals) {
            appendPeripheral(peripherals, peripheral);
        }
    }

    inline void write(edc2svd::Device const& device,
                      std::ostream&          out) {
        pugi::xml_document doc;
        SvdFromDevice(device, doc);
        doc.save(out, "  ", pugi::format_default, pugi::encoding_utf8);
    }

    inline std::string render(edc2svd::Device const& device) {
        std::ostringstream out;
        write(device, out);
        return out.str();
    }

}}   // namespace Generator::Svd
