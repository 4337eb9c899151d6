// terminal_modes.cpp - RFC 4254 mode encoding

#include "sshcomm/terminal_modes.hpp"

#include <algorithm>

namespace sshcomm
{

    auto terminal_modes::defaults() -> terminal_modes
    {
        terminal_modes modes;
        static_cast<void>(modes.set(tty_opcode::echo, 0)
                              .set(tty_opcode::ispeed, constants::default_tty_speed)
                              .set(tty_opcode::ospeed, constants::default_tty_speed));
        return modes;
    }

    auto terminal_modes::set(tty_opcode op, std::uint32_t value) -> terminal_modes &
    {
        auto it = std::ranges::find(entries_, op, &entry::first);
        if (it != entries_.end())
        {
            it->second = value;
        }
        else
        {
            entries_.emplace_back(op, value);
        }
        return *this;
    }

    auto terminal_modes::get(tty_opcode op) const noexcept -> std::optional<std::uint32_t>
    {
        auto it = std::ranges::find(entries_, op, &entry::first);
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    auto terminal_modes::encode() const -> byte_buffer
    {
        byte_buffer out;
        out.reserve(encoded_size());

        for (auto const &[op, value] : entries_)
        {
            out.push_back(static_cast<std::uint8_t>(op));
            // uint32 in network byte order
            out.push_back(static_cast<std::uint8_t>(value >> 24));
            out.push_back(static_cast<std::uint8_t>(value >> 16));
            out.push_back(static_cast<std::uint8_t>(value >> 8));
            out.push_back(static_cast<std::uint8_t>(value & 0xFF));
        }

        out.push_back(static_cast<std::uint8_t>(tty_opcode::end));
        return out;
    }

} // namespace sshcomm
