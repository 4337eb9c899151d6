#pragma once

// scp_protocol.hpp - framing for the legacy scp sink ("scp -t") protocol
//
// upload sequence seen by the remote receiver:
//   C<mode> <length> <filename>\n
//   <length raw bytes>
//   \0
//   EOF on stdin
//
// after each step the receiver answers with one status byte:
//   0 = ok, 1 = warning + message line, 2 = fatal + message line

#include "common.hpp"

#include <string>
#include <string_view>

namespace sshcomm::scp
{

    struct remote_target
    {
        std::string directory;
        std::string filename;
    };

    enum class ack_status : std::uint8_t
    {
        ok = 0,
        warning = 1,
        fatal = 2,
    };

    struct ack
    {
        ack_status status{ack_status::ok};
        std::string message;

        [[nodiscard]] auto is_ok() const noexcept -> bool { return status == ack_status::ok; }
    };

    /// @brief Split a remote path into directory and final segment (POSIX dirname / basename)
    /// "out.txt" -> {".", "out.txt"}, "/out.txt" -> {"/", "out.txt"}, "a//b/" is invalid (empty name)
    [[nodiscard]] auto split_remote_path(std::string_view remote_path) -> result<remote_target>;

    /// @brief Quote a word for a POSIX shell using single quotes
    [[nodiscard]] auto shell_quote(std::string_view word) -> std::string;

    /// @brief Command line that starts the remote receiver in sink mode
    [[nodiscard]] auto sink_command(std::string_view program, std::string_view directory) -> std::string;

    /// @brief "C0644 <length> <filename>\n"
    [[nodiscard]] auto control_line(std::uint32_t mode, std::uint64_t length, std::string_view filename)
        -> result<std::string>;

    inline constexpr std::uint8_t end_of_file_marker = 0x00;

    /// @brief Interpret a status byte; message is the text the receiver sent after a non-zero byte
    [[nodiscard]] auto parse_ack(std::uint8_t status_byte, std::string_view message) -> result<ack>;

} // namespace sshcomm::scp
