#pragma once

#include "fmt_wrapper.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace edc2svd {

enum class ErrorKind : std::uint8_t {
    MalformedNumber,
    UnrecognizedPortalsSpec,
    UnexpectedFieldEntry,
    NameMismatch,
    MissingPeripheralHint,
    AddressOrderingViolation,
    MissingStructure,
    FieldLayoutOverflow,
    InvalidFieldWidth
};

constexpr std::string_view toString(ErrorKind kind) noexcept {
    switch(kind) {
    case ErrorKind::MalformedNumber:          return "MalformedNumber";
    case ErrorKind::UnrecognizedPortalsSpec:  return "UnrecognizedPortalsSpec";
    case ErrorKind::UnexpectedFieldEntry:     return "UnexpectedFieldEntry";
    case ErrorKind::NameMismatch:             return "NameMismatch";
    case ErrorKind::MissingPeripheralHint:    return "MissingPeripheralHint";
    case ErrorKind::AddressOrderingViolation: return "AddressOrderingViolation";
    case ErrorKind::MissingStructure:         return "MissingStructure";
    case ErrorKind::FieldLayoutOverflow:      return "FieldLayoutOverflow";
    case ErrorKind::InvalidFieldWidth:        return "InvalidFieldWidth";
    }
    return "unknown";
}

// Every conversion failure is fatal; the kind is kept for callers that need
// to tell them apart.
class ConversionError : public std::runtime_error {
public:
    ConversionError(ErrorKind          kind,
                    std::string const& message)
      : std::runtime_error{fmt::format("{}: {}", toString(kind), message)}
      , kind_{kind} {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

template<typename... Args>
[[noreturn]] void fail(ErrorKind                        kind,
                       fmt::format_string<Args...> const format,
                       Args&&... args) {
    throw ConversionError{kind, fmt::format(format, std::forward<Args>(args)...)};
}

}   // namespace edc2svd
