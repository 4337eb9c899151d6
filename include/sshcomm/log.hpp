#pragma once

// log.hpp - stderr diagnostics, off unless asked for

#include <cstdint>
#include <fmt/format.h>
#include <string_view>
#include <utility>

namespace sshcomm::log
{

    enum class level : std::uint8_t
    {
        quiet = 0,
        info,
        debug,
    };

    // initialised from SSHCOMM_LOG (0/quiet, 1/info, 2/debug) on first use
    [[nodiscard]] auto current_level() noexcept -> level;
    void set_level(level lvl) noexcept;

    [[nodiscard]] auto parse_level(std::string_view text) noexcept -> level;

    // count of -v flags: 1 is info, 2 or more is debug
    [[nodiscard]] auto level_from_verbosity(int verbosity) noexcept -> level;

    [[nodiscard]] inline auto enabled(level lvl) noexcept -> bool
    {
        return lvl != level::quiet && static_cast<std::uint8_t>(lvl) <= static_cast<std::uint8_t>(current_level());
    }

    void write(level lvl, std::string_view message);

    template <typename... Args>
    void info(fmt::format_string<Args...> format, Args &&...args)
    {
        if (enabled(level::info))
        {
            write(level::info, fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void debug(fmt::format_string<Args...> format, Args &&...args)
    {
        if (enabled(level::debug))
        {
            write(level::debug, fmt::format(format, std::forward<Args>(args)...));
        }
    }

} // namespace sshcomm::log
