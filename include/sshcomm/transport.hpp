#pragma once

// transport.hpp - the connection / channel seam
// production code plugs libssh in here, tests plug in a scripted fake

#include "common.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace sshcomm
{

    enum class stream_id : std::uint8_t
    {
        stdout_stream = 0,
        stderr_stream = 1,
    };

    struct pty_request
    {
        std::string term;
        int columns{0};
        int rows{0};
        byte_buffer encoded_modes; // terminated by TTY_OP_END
    };

    // ============================================================================
    // channel - one logical session multiplexed over a connection
    // ============================================================================

    class channel
    {
    public:
        virtual ~channel() = default;

        channel(channel const &) = delete;
        auto operator=(channel const &) -> channel & = delete;
        channel(channel &&) = delete;
        auto operator=(channel &&) -> channel & = delete;

        [[nodiscard]] virtual auto request_pty(pty_request const &request) -> void_result = 0;
        [[nodiscard]] virtual auto exec(std::string_view command) -> void_result = 0;

        // non-blocking; may write fewer bytes than asked, 0 while the remote window is full
        [[nodiscard]] virtual auto write(std::span<std::uint8_t const> data) -> result<std::size_t> = 0;
        [[nodiscard]] virtual auto send_eof() -> void_result = 0;

        // non-blocking; 0 means nothing buffered right now
        [[nodiscard]] virtual auto read(std::span<std::uint8_t> buffer, stream_id stream) -> result<std::size_t> = 0;

        // remote side sent EOF or closed the channel
        [[nodiscard]] virtual auto remote_eof() -> bool = 0;

        // non-blocking; nullopt until the remote closed the channel
        [[nodiscard]] virtual auto exit_status() -> result<std::optional<int>> = 0;

        // idempotent
        virtual void close() noexcept = 0;

    protected:
        channel() = default;
    };

    // ============================================================================
    // connection - the multiplexer; open_channel must be thread-safe
    // ============================================================================

    class connection
    {
    public:
        virtual ~connection() = default;

        connection(connection const &) = delete;
        auto operator=(connection const &) -> connection & = delete;
        connection(connection &&) = delete;
        auto operator=(connection &&) -> connection & = delete;

        [[nodiscard]] virtual auto open_channel() -> result<std::unique_ptr<channel>> = 0;
        [[nodiscard]] virtual auto is_connected() const noexcept -> bool = 0;

    protected:
        connection() = default;
    };

} // namespace sshcomm
