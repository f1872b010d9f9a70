#pragma once

#include "edc_errors.hpp"
#include "svd_types.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace edc2svd {

namespace Constants {
    // KSEG1, the uncached view of the physical address space
    inline constexpr std::uint32_t SegmentMask    = 0xA000'0000;
    inline constexpr std::uint32_t RegisterSize   = 32;
    inline constexpr std::uint32_t ClrOffset      = 0x4;
    inline constexpr std::uint32_t SetOffset      = 0x8;
    inline constexpr std::uint32_t InvOffset      = 0xC;
    inline constexpr auto          RegionMarker   = std::string_view{"periph"};
    inline constexpr auto          DefaultPortals = std::string_view{"- - -"};
    inline constexpr auto          ResetUnknowns  = std::string_view{"-xu"};
}   // namespace Constants

namespace detail {
    inline bool parseUnsigned(std::string_view text,
                              int              base,
                              std::uint32_t&   value) noexcept {
        if(text.empty()) {
            return false;
        }
        auto const* const last = text.data() + text.size();
        auto const [ptr, ec]   = std::from_chars(text.data(), last, value, base);
        return ec == std::errc{} && ptr == last;
    }
}   // namespace detail

// "0x1A" and "26" both yield 26.
inline std::uint32_t parseAddressLiteral(std::string_view text) {
    std::uint32_t value = 0;
    bool const    parsed
      = text.starts_with("0x") ? detail::parseUnsigned(text.substr(2), 16, value)
                               : detail::parseUnsigned(text, 10, value);
    if(!parsed) {
        fail(ErrorKind::MalformedNumber, "no valid number \"{}\"", text);
    }
    return value;
}

// Unimplemented (-), undefined (x) and unknown (u) bits reset to 0.
inline std::uint32_t decodeResetPattern(std::string_view text) {
    std::string cleaned{text};
    std::ranges::replace_if(
      cleaned,
      [](char character) {
          return Constants::ResetUnknowns.find(character) != std::string_view::npos;
      },
      '0');

    std::uint32_t value = 0;
    if(!detail::parseUnsigned(cleaned, 2, value)) {
        fail(ErrorKind::MalformedNumber, "cannot parse mclr attribute string \"{}\"", text);
    }
    return value;
}

inline Portals decodePortals(std::string_view text) {
    if(text == "CLR SET INV") {
        return Portals{.clr = true, .set = true, .inv = true};
    }
    if(text == "CLR - -") {
        return Portals{.clr = true, .set = false, .inv = false};
    }
    if(text == "- - -") {
        return Portals{};
    }
    fail(ErrorKind::UnrecognizedPortalsSpec, "unexpected portals attribute: \"{}\"", text);
}

inline std::string_view firstWord(std::string_view text) noexcept {
    auto const end = std::ranges::find_if(text, [](char character) {
        return character == ' ' || character == '\t' || character == '\n' || character == '\r';
    });
    return text.substr(0, static_cast<std::size_t>(end - text.begin()));
}

}   // namespace edc2svd
