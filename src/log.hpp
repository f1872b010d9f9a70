#pragma once

#include "fmt_wrapper.hpp"

#include <cstdint>
#include <cstdio>
#include <utility>

namespace edc2svd::Log {

// error is the quiet threshold; fatal errors leave through ConversionError.
enum class Level : std::uint8_t { error, warn, info };

inline Level& threshold() noexcept {
    static Level level = Level::error;
    return level;
}

inline void setVerbose(bool verbose) noexcept {
    threshold() = verbose ? Level::info : Level::error;
}

inline bool enabled(Level level) noexcept { return level <= threshold(); }

template<typename... Args>
void write(Level                            level,
           fmt::format_string<Args...> const format,
           Args&&... args) {
    if(!enabled(level)) {
        return;
    }
    fmt::print(stdout, format, std::forward<Args>(args)...);
    fmt::print(stdout, "\n");
}

template<typename... Args>
void warn(fmt::format_string<Args...> const format,
          Args&&... args) {
    write(Level::warn, format, std::forward<Args>(args)...);
}

template<typename... Args>
void info(fmt::format_string<Args...> const format,
          Args&&... args) {
    write(Level::info, format, std::forward<Args>(args)...);
}

}   // namespace edc2svd::Log
