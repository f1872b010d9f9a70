#pragma once

#include "edc_decode.hpp"
#include "edc_errors.hpp"
#include "fmt_wrapper.hpp"
#include "log.hpp"
#include "svd_types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <pugixml.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace edc2svd {

struct FieldLayout {
    std::vector<Field> fields;
    std::uint32_t      bitCursor = 0;
};

// One SFRDef, decoded.
struct SfrDescriptor {
    std::string   name;
    std::uint32_t address    = 0;
    std::uint32_t resetValue = 0;
    std::string   portalsText;
    Portals       portals;
    std::string   peripheral;
    FieldLayout   layout;
};

// EDC documents qualify elements and attributes with the edc: prefix;
// lookups go by local name so prefixed and bare documents both work.
inline std::string_view localName(char const* qualifiedName) noexcept {
    std::string_view const name{qualifiedName};
    auto const             colon = name.find(':');
    return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

inline pugi::xml_attribute findAttribute(pugi::xml_node const& node,
                                         std::string_view      name) {
    for(auto const& attribute : node.attributes()) {
        if(localName(attribute.name()) == name) {
            return attribute;
        }
    }
    return pugi::xml_attribute{};
}

inline pugi::xml_node findChild(pugi::xml_node const& node,
                                std::string_view      name) {
    for(auto const& child : node.children()) {
        if(child.type() == pugi::node_element && localName(child.name()) == name) {
            return child;
        }
    }
    return pugi::xml_node{};
}

template<typename F>
void forEachChild(pugi::xml_node const& node,
                  std::string_view      name,
                  F&&                   f) {
    for(auto const& child : node.children()) {
        if(child.type() == pugi::node_element && localName(child.name()) == name) {
            f(child);
        }
    }
}

inline std::string_view getCheckedAttribute(pugi::xml_node const& node,
                                            std::string_view      name) {
    auto const attribute = findAttribute(node, name);
    if(attribute.empty()) {
        fail(ErrorKind::MissingStructure,
             "attribute {} missing in {} {}",
             name,
             localName(node.name()),
             findAttribute(node, "name").as_string());
    }
    return attribute.value();
}

inline std::optional<std::string_view> getOptionalAttribute(pugi::xml_node const& node,
                                                            std::string_view      name) {
    auto const attribute = findAttribute(node, name);
    if(attribute.empty()) {
        return std::nullopt;
    }
    return std::string_view{attribute.value()};
}

inline pugi::xml_node getCheckedChild(pugi::xml_node const& node,
                                      std::string_view      name) {
    auto const child = findChild(node, name);
    if(child.empty()) {
        fail(ErrorKind::MissingStructure,
             "{} element missing in {} {}",
             name,
             localName(node.name()),
             findAttribute(node, "name").as_string());
    }
    return child;
}

inline FieldLayout FieldLayoutFromEDC(pugi::xml_node const& mode) {
    FieldLayout layout;
    for(auto const& entry : mode.children()) {
        if(entry.type() != pugi::node_element) {
            continue;
        }
        auto const    kind = localName(entry.name());
        std::uint64_t next = layout.bitCursor;

        if(kind == "SFRFieldDef") {
            std::string const fieldName{getCheckedAttribute(entry, "cname")};
            auto const        displayName = getCheckedAttribute(entry, "name");
            if(fieldName != displayName) {
                Log::warn("cname = {} but name = {}", fieldName, displayName);
            }

            auto const width = parseAddressLiteral(getCheckedAttribute(entry, "nzwidth"));
            if(width == 0) {
                fail(ErrorKind::InvalidFieldWidth, "field {} has zero width", fieldName);
            }
            next += width;
            if(next > Constants::RegisterSize) {
                fail(ErrorKind::FieldLayoutOverflow,
                     "field {} ends at bit {} of a {} bit register",
                     fieldName,
                     next - 1,
                     Constants::RegisterSize);
            }

            Field field{.name     = fieldName,
                        .startBit = layout.bitCursor,
                        .stopBit  = static_cast<std::uint32_t>(next - 1)};
            layout.fields.push_back(std::move(field));
        } else if(kind == "AdjustPoint") {
            next += parseAddressLiteral(getCheckedAttribute(entry, "offset"));
            if(next > Constants::RegisterSize) {
                fail(ErrorKind::FieldLayoutOverflow,
                     "adjust point moves bit position to {} in a {} bit register",
                     next,
                     Constants::RegisterSize);
            }
        } else {
            fail(ErrorKind::UnexpectedFieldEntry,
                 "unexpected element {} in field definition",
                 kind);
        }
        layout.bitCursor = static_cast<std::uint32_t>(next);
    }
    return layout;
}

inline void traceFields(FieldLayout const& layout) {
    for(auto const& field : layout.fields) {
        Log::info("\t\t[{}:{}]\t{}", field.stopBit, field.startBit, field.name);
    }
}

inline Register makeRegister(std::string        name,
                             std::uint32_t      offset,
                             std::uint32_t      resetValue,
                             FieldLayout const& layout) {
    Register registerResult;
    registerResult.description   = fmt::format("{} register", name);
    registerResult.name          = std::move(name);
    registerResult.addressOffset = offset;
    registerResult.size          = Constants::RegisterSize;
    registerResult.resetValue    = resetValue;
    registerResult.hasFields     = layout.bitCursor > 0;
    if(registerResult.hasFields) {
        registerResult.fields = layout.fields;
    }
    return registerResult;
}

// Appends the register and its CLR/SET/INV aliases. Reading an alias is
// undefined, so their reset value is 0.
inline void appendRegisters(Peripheral&          peripheral,
                            SfrDescriptor const& sfr,
                            std::uint32_t        offset) {
    peripheral.registers.push_back(makeRegister(sfr.name, offset, sfr.resetValue, sfr.layout));
    traceFields(sfr.layout);

    auto addAlias = [&](std::string_view suffix, std::uint32_t aliasOffset) {
        Log::info("\t{}{}: {:x}, offset = {:x}",
                  sfr.name,
                  suffix,
                  sfr.address + aliasOffset,
                  offset + aliasOffset);
        peripheral.registers.push_back(makeRegister(fmt::format("{}{}", sfr.name, suffix),
                                                    offset + aliasOffset,
                                                    0,
                                                    sfr.layout));
        traceFields(sfr.layout);
    };

    if(sfr.portals.clr) {
        addAlias("CLR", Constants::ClrOffset);
    }
    if(sfr.portals.set) {
        addAlias("SET", Constants::SetOffset);
    }
    if(sfr.portals.inv) {
        addAlias("INV", Constants::InvOffset);
    }
}

inline std::string peripheralFromModuleSource(std::string_view moduleSource) {
    static std::map<std::string, std::string, std::less<>> const table{
      {                 "DOS-01618_RPINRx.Module",    "PPS"},
      {                  "DOS-01618_RPORx.Module",    "PPS"},
      {                 "DOS-01423_RPINRx.Module",    "PPS"},
      {                  "DOS-01423_RPORx.Module",    "PPS"},
      {"DOS-01475_lpwr_deep_sleep_ctrl_v2.Module", "DSCTRL"}, // deep sleep controller
    };
    auto const entry = table.find(moduleSource);
    if(entry == table.end()) {
        return std::string{};
    }
    return entry->second;
}

// Hint priority: baseofperipheral, non-empty memberofperipheral, grp, _modsrc.
inline std::string inferPeripheral(pugi::xml_node const& sfr,
                                   std::string_view      name) {
    std::string peripheral;
    auto        memberOf = getOptionalAttribute(sfr, "memberofperipheral");
    if(memberOf && memberOf->empty()) {
        memberOf.reset();
    }

    if(auto const baseOf = getOptionalAttribute(sfr, "baseofperipheral")) {
        peripheral = *baseOf;
    } else if(memberOf) {
        peripheral = *memberOf;
    } else if(auto const group = getOptionalAttribute(sfr, "grp")) {
        peripheral = *group;
    } else if(auto const moduleSource = getOptionalAttribute(sfr, "_modsrc")) {
        peripheral = peripheralFromModuleSource(*moduleSource);
        if(peripheral.empty()) {
            fail(ErrorKind::MissingPeripheralHint,
                 "undefined peripheral for {} (_modsrc {})",
                 name,
                 *moduleSource);
        }
    } else {
        fail(ErrorKind::MissingPeripheralHint, "missing peripheral for {}", name);
    }

    peripheral = std::string{firstWord(peripheral)};
    if(peripheral.empty()) {
        fail(ErrorKind::MissingPeripheralHint, "empty peripheral info for {}", name);
    }
    return peripheral;
}

inline SfrDescriptor SfrFromEDC(pugi::xml_node const& sfr) {
    SfrDescriptor result;
    result.address
      = parseAddressLiteral(getCheckedAttribute(sfr, "_addr")) | Constants::SegmentMask;

    result.name      = getCheckedAttribute(sfr, "name");
    auto const cname = getCheckedAttribute(sfr, "cname");
    if(result.name != cname) {
        fail(ErrorKind::NameMismatch, "register name {} but cname {}", result.name, cname);
    }

    result.portalsText = getOptionalAttribute(sfr, "portals").value_or(Constants::DefaultPortals);
    result.portals     = decodePortals(result.portalsText);
    result.resetValue  = decodeResetPattern(getCheckedAttribute(sfr, "mclr"));
    result.peripheral  = inferPeripheral(sfr, result.name);

    // only the first mode is used
    auto const modeList = getCheckedChild(sfr, "SFRModeList");
    auto const mode     = getCheckedChild(modeList, "SFRMode");
    result.layout = FieldLayoutFromEDC(mode);
    return result;
}

// Groups consecutive registers with the same peripheral label. Registers
// must arrive sorted by address, so each new group starts above the last.
class PeripheralGrouper {
public:
    explicit PeripheralGrouper(Device& device) : device_{device} {}

    void add(SfrDescriptor const& sfr) {
        if(!current_ || sfr.peripheral != label_) {
            open(sfr);
        }
        auto& peripheral = device_.peripherals[*current_];
        if(sfr.address < peripheral.baseAddress) {
            fail(ErrorKind::AddressOrderingViolation,
                 "register {} at 0x{:x} lies below base address 0x{:x} of {}",
                 sfr.name,
                 sfr.address,
                 peripheral.baseAddress,
                 peripheral.name);
        }
        auto const offset = sfr.address - peripheral.baseAddress;
        Log::info("  {}", sfr.name);
        Log::info("\t{}   : {:x}, offset = {:x}, reset = {:x} ({})",
                  sfr.name,
                  sfr.address,
                  offset,
                  sfr.resetValue,
                  sfr.portalsText);
        appendRegisters(peripheral, sfr, offset);
        Log::info("");
    }

private:
    void open(SfrDescriptor const& sfr) {
        if(sfr.address <= baseAddress_) {
            fail(ErrorKind::AddressOrderingViolation,
                 "peripheral {} at 0x{:x} does not lie above the previous base address 0x{:x}",
                 sfr.peripheral,
                 sfr.address,
                 baseAddress_);
        }
        baseAddress_ = sfr.address;
        label_       = sfr.peripheral;

        Peripheral peripheral;
        peripheral.name        = label_;
        peripheral.description = fmt::format("{} peripheral", label_);
        peripheral.baseAddress = baseAddress_;
        device_.peripherals.push_back(std::move(peripheral));
        current_ = device_.peripherals.size() - 1;
        Log::info("{} base_addr = {:x}", label_, baseAddress_);
    }

    Device&                    device_;
    std::optional<std::size_t> current_;
    std::string                label_;
    std::uint32_t              baseAddress_ = 0;
};

inline void SectorFromEDC(pugi::xml_node const& sector,
                          Device&               device) {
    PeripheralGrouper grouper{device};
    forEachChild(sector, "SFRDef", [&](pugi::xml_node const& sfr) {
        grouper.add(SfrFromEDC(sfr));
    });
}

inline bool isPeripheralSector(pugi::xml_node const& sector) {
    return std::string_view{findAttribute(sector, "regionid").as_string()}.starts_with(
      Constants::RegionMarker);
}

inline Device DeviceFromEDC(pugi::xml_node const& root) {
    Device device;
    device.name = getCheckedAttribute(root, "name");

    auto const physicalSpace = getCheckedChild(root, "PhysicalSpace");
    forEachChild(physicalSpace, "SFRDataSector", [&](pugi::xml_node const& sector) {
        if(isPeripheralSector(sector)) {
            SectorFromEDC(sector, device);
        }
    });
    return device;
}

}   // namespace edc2svd
