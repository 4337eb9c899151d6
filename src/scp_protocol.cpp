// scp_protocol.cpp - scp sink framing helpers

#include "sshcomm/scp_protocol.hpp"

namespace sshcomm::scp
{

    namespace
    {

        [[nodiscard]] constexpr auto is_valid_filename(std::string_view name) noexcept -> bool
        {
            if (name.empty() || name == "." || name == "..")
            {
                return false;
            }
            return name.find_first_of("/\n") == std::string_view::npos;
        }

    } // namespace

    auto split_remote_path(std::string_view remote_path) -> result<remote_target>
    {
        if (remote_path.empty() || remote_path.back() == '/')
        {
            return std::unexpected(error_code::invalid_argument);
        }

        auto const slash = remote_path.rfind('/');
        if (slash == std::string_view::npos)
        {
            if (!is_valid_filename(remote_path))
            {
                return std::unexpected(error_code::invalid_argument);
            }
            return remote_target{".", std::string{remote_path}};
        }

        auto const filename = remote_path.substr(slash + 1);
        if (!is_valid_filename(filename))
        {
            return std::unexpected(error_code::invalid_argument);
        }

        auto directory = remote_path.substr(0, slash);
        while (!directory.empty() && directory.back() == '/')
        {
            directory.remove_suffix(1);
        }

        // only slashes before the name: the root directory
        if (directory.empty())
        {
            return remote_target{"/", std::string{filename}};
        }

        return remote_target{std::string{directory}, std::string{filename}};
    }

    auto shell_quote(std::string_view word) -> std::string
    {
        std::string quoted;
        quoted.reserve(word.size() + 2);
        quoted.push_back('\'');
        for (char const c : word)
        {
            if (c == '\'')
            {
                quoted.append("'\\''");
            }
            else
            {
                quoted.push_back(c);
            }
        }
        quoted.push_back('\'');
        return quoted;
    }

    auto sink_command(std::string_view program, std::string_view directory) -> std::string
    {
        return fmt::format("{} -vt {}", program, shell_quote(directory));
    }

    auto control_line(std::uint32_t mode, std::uint64_t length, std::string_view filename) -> result<std::string>
    {
        if (!is_valid_filename(filename))
        {
            return std::unexpected(error_code::invalid_argument);
        }
        return fmt::format("C{:04o} {} {}\n", mode & 07777U, length, filename);
    }

    auto parse_ack(std::uint8_t status_byte, std::string_view message) -> result<ack>
    {
        switch (status_byte)
        {
        case static_cast<std::uint8_t>(ack_status::ok):
            return ack{ack_status::ok, {}};
        case static_cast<std::uint8_t>(ack_status::warning):
            return ack{ack_status::warning, std::string{message}};
        case static_cast<std::uint8_t>(ack_status::fatal):
            return ack{ack_status::fatal, std::string{message}};
        default:
            return std::unexpected(error_code::remote_rejected);
        }
    }

} // namespace sshcomm::scp
