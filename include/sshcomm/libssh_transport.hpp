#pragma once

// libssh_transport.hpp - connection / channel implementation on top of libssh
// one ssh_session, any number of channels, one mutex serializing libssh access

#include "transport.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

// libssh's ssh_session is a pointer to this; keeps libssh out of our headers
struct ssh_session_struct;

namespace sshcomm
{

    // =============================================================================
    // connection configuration
    // =============================================================================

    struct connection_config
    {
        std::string host;
        int port{22};
        std::string username;
        std::string password;                   // optional, prefer key auth
        std::filesystem::path private_key_path; // optional, uses default if empty
        std::string private_key_passphrase;     // optional
        std::chrono::seconds connect_timeout{30};
        bool strict_host_key_checking{false}; // set true for production
        int verbosity{0};                     // libssh log verbosity, 0=quiet
    };

    // =============================================================================
    // libssh connection
    // =============================================================================

    class libssh_connection final : public connection
    {
    public:
        ~libssh_connection() override;

        /// @brief Connect and authenticate (public key from file, default keys, then password)
        [[nodiscard]] static auto connect(connection_config const &config)
            -> result<std::shared_ptr<libssh_connection>>;

        /// @brief Take ownership of a session that is already connected and authenticated
        [[nodiscard]] static auto adopt(ssh_session_struct *session) -> result<std::shared_ptr<libssh_connection>>;

        [[nodiscard]] auto open_channel() -> result<std::unique_ptr<channel>> override;
        [[nodiscard]] auto is_connected() const noexcept -> bool override;

        // channels already open stay usable until they fail; new ones cannot be opened
        void disconnect();

        [[nodiscard]] auto host() const noexcept -> std::string_view;
        [[nodiscard]] auto user() const noexcept -> std::string_view;
        [[nodiscard]] auto port() const noexcept -> int;

        class impl;

    private:
        std::shared_ptr<impl> impl_;

        explicit libssh_connection(std::shared_ptr<impl> impl);
    };

} // namespace sshcomm
