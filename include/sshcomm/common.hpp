#pragma once

// common.hpp - error types and result aliases shared by every sshcomm module

#include <cstdint>
#include <expected>
#include <fmt/format.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sshcomm
{

    // ============================================================================
    // error handling - setup and transport failures are plain codes,
    // a remote process exiting non-zero carries its status
    // ============================================================================

    enum class error_code : std::uint8_t
    {
        success = 0,
        not_connected,
        connection_failed,
        authentication_failed,
        host_key_verification_failed,
        session_open_failed,
        pty_request_failed,
        exec_failed,
        stdin_already_bound,
        write_failed,
        read_failed,
        eof_failed,
        exit_status_unavailable,
        source_read_failed,
        file_open_failed,
        remote_rejected,
        invalid_argument,
        cancelled,
    };

    struct error_code_formatter
    {
        [[nodiscard]] static constexpr auto to_string(error_code const ec) noexcept -> std::string_view
        {
            switch (ec)
            {
            case error_code::success:
                return "success";
            case error_code::not_connected:
                return "not_connected";
            case error_code::connection_failed:
                return "connection_failed";
            case error_code::authentication_failed:
                return "authentication_failed";
            case error_code::host_key_verification_failed:
                return "host_key_verification_failed";
            case error_code::session_open_failed:
                return "session_open_failed";
            case error_code::pty_request_failed:
                return "pty_request_failed";
            case error_code::exec_failed:
                return "exec_failed";
            case error_code::stdin_already_bound:
                return "stdin_already_bound";
            case error_code::write_failed:
                return "write_failed";
            case error_code::read_failed:
                return "read_failed";
            case error_code::eof_failed:
                return "eof_failed";
            case error_code::exit_status_unavailable:
                return "exit_status_unavailable";
            case error_code::source_read_failed:
                return "source_read_failed";
            case error_code::file_open_failed:
                return "file_open_failed";
            case error_code::remote_rejected:
                return "remote_rejected";
            case error_code::invalid_argument:
                return "invalid_argument";
            case error_code::cancelled:
                return "cancelled";
            }
            return "unknown_error";
        }
    };

    // remote process terminated with a non-zero exit status
    struct exit_error
    {
        int exit_status{0};

        [[nodiscard]] constexpr auto operator==(exit_error const &) const noexcept -> bool = default;
    };

    using error = std::variant<error_code, exit_error>;

    template <typename T>
    using result = std::expected<T, error>;

    using void_result = std::expected<void, error>;

    /// @brief Exit status carried by an error, if it is an exit_error
    [[nodiscard]] constexpr auto exit_status_of(error const &e) noexcept -> std::optional<int>
    {
        if (auto const *exit = std::get_if<exit_error>(&e))
        {
            return exit->exit_status;
        }
        return std::nullopt;
    }

    /// @brief Code carried by an error, error_code::success for exit errors
    [[nodiscard]] constexpr auto code_of(error const &e) noexcept -> error_code
    {
        if (auto const *code = std::get_if<error_code>(&e))
        {
            return *code;
        }
        return error_code::success;
    }

    [[nodiscard]] auto to_string(error const &e) -> std::string;

    // thrown by operations that exist in the interface but are not implemented
    class not_implemented_error : public std::logic_error
    {
    public:
        explicit not_implemented_error(std::string const &what) : std::logic_error(what) {}
    };

    using byte_buffer = std::vector<std::uint8_t>;

    namespace constants
    {
        inline constexpr std::uint32_t default_file_mode = 0644;
        inline constexpr std::size_t default_io_chunk_size = 32 * 1024;
        inline constexpr std::uint32_t default_tty_speed = 14400;
        inline constexpr int default_pty_columns = 80;
        inline constexpr int default_pty_rows = 40;
    } // namespace constants

} // namespace sshcomm

template <>
struct fmt::formatter<sshcomm::error_code> : fmt::formatter<std::string_view>
{
    auto format(sshcomm::error_code const ec, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(sshcomm::error_code_formatter::to_string(ec), ctx);
    }
};

template <>
struct fmt::formatter<sshcomm::error> : fmt::formatter<std::string_view>
{
    auto format(sshcomm::error const &e, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(sshcomm::to_string(e), ctx);
    }
};
