#pragma once

// terminal_modes.hpp - encoded terminal modes for pty requests (RFC 4254 section 8)

#include "common.hpp"

#include <utility>
#include <vector>

namespace sshcomm
{

    // opcodes from RFC 4254 section 8: the defaults plus the line discipline
    // flags callers switch when they need a cooked terminal
    enum class tty_opcode : std::uint8_t
    {
        end = 0,
        icrnl = 36,
        isig = 50,
        icanon = 51,
        echo = 53,
        onlcr = 72,
        ispeed = 128,
        ospeed = 129,
    };

    // ============================================================================
    // terminal modes builder - fluent, insertion ordered
    // ============================================================================

    class terminal_modes
    {
    public:
        using entry = std::pair<tty_opcode, std::uint32_t>;

        // size of one encoded entry: opcode byte + uint32
        static constexpr std::size_t entry_size = 5;

    private:
        std::vector<entry> entries_{};

    public:
        terminal_modes() = default;

        // echo off, 14.4 kbaud in both directions
        [[nodiscard]] static auto defaults() -> terminal_modes;

        // later set() of the same opcode overwrites the value in place
        [[nodiscard]] auto set(tty_opcode op, std::uint32_t value) -> terminal_modes &;

        [[nodiscard]] auto get(tty_opcode op) const noexcept -> std::optional<std::uint32_t>;

        [[nodiscard]] auto entries() const noexcept -> std::vector<entry> const & { return entries_; }
        [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }

        // entries followed by TTY_OP_END
        [[nodiscard]] auto encode() const -> byte_buffer;

        [[nodiscard]] constexpr auto encoded_size() const noexcept -> std::size_t
        {
            return entries_.size() * entry_size + 1;
        }
    };

} // namespace sshcomm
