// common.cpp - error rendering

#include "sshcomm/common.hpp"

namespace sshcomm
{

    auto to_string(error const &e) -> std::string
    {
        if (auto const status = exit_status_of(e))
        {
            return fmt::format("remote process exited with status {}", *status);
        }
        return std::string{error_code_formatter::to_string(code_of(e))};
    }

} // namespace sshcomm
