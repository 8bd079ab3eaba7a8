#pragma once

#include "format.hpp"

#include <atomic>
#include <cstdint>
#include <format>
#include <iostream>
#include <string_view>

namespace annomics::log {

    using namespace std::string_view_literals;

    enum class level : uint8_t { error, warn, info, debug };

    inline constexpr std::string_view to_string(level lvl) {
        switch (lvl) {
            case level::error:
                return "error"sv;
            case level::warn:
                return "warn"sv;
            case level::info:
                return "info"sv;
            case level::debug:
                return "debug"sv;
        }
        return "info"sv;
    }

    namespace detail {
        inline std::atomic<level> threshold{level::info};
    }  // namespace detail

    inline void set_level(level lvl) {
        detail::threshold.store(lvl, std::memory_order_relaxed);
    }

    inline level current_level() {
        return detail::threshold.load(std::memory_order_relaxed);
    }

    inline bool enabled(level lvl) {
        return static_cast<uint8_t>(lvl) <= static_cast<uint8_t>(current_level());
    }

    // stdout carries the protocol; every log line goes to stderr.
    template <typename... Args>
    void write(level lvl, std::format_string<Args...> fmt, Args&&... args) {
        if (!enabled(lvl)) {
            return;
        }
        std::cerr << "annomics[" << to_string(lvl) << "]: " << std::format(fmt, std::forward<Args>(args)...)
                  << '\n';
    }

    template <typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) {
        write(level::error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::format_string<Args...> fmt, Args&&... args) {
        write(level::warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) {
        write(level::info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) {
        write(level::debug, fmt, std::forward<Args>(args)...);
    }

}  // namespace annomics::log
