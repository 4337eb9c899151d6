// libssh_transport.cpp - libssh backed connection and channels

#include "sshcomm/libssh_transport.hpp"

#include "sshcomm/log.hpp"

#include <algorithm>
#include <limits>
#include <mutex>

// only this file sees libssh
#include <libssh/libssh.h>

namespace sshcomm
{

    // =============================================================================
    // shared connection state - outlives the facade while channels are open
    // =============================================================================

    class libssh_connection::impl
    {
    public:
        ssh_session ssh_{nullptr};
        // polls the session socket so window adjusts and channel close arrive without a blocking call
        ssh_event event_{nullptr};
        std::string host_;
        std::string user_;
        int port_{22};

        // every libssh call on ssh_ or one of its channels happens under this
        std::mutex mutex_;

        // ssh_disconnect frees all channels; afterwards channel handles are dangling
        bool disconnected_{false};

        impl() = default;

        ~impl()
        {
            detach_event();
            if (ssh_ != nullptr)
            {
                if (!disconnected_)
                {
                    ssh_disconnect(ssh_);
                }
                ssh_free(ssh_);
            }
        }

        impl(impl const &) = delete;
        auto operator=(impl const &) -> impl & = delete;
        impl(impl &&) = delete;
        auto operator=(impl &&) -> impl & = delete;

        // caller holds mutex_
        [[nodiscard]] auto usable() const noexcept -> bool
        {
            return ssh_ != nullptr && !disconnected_ && ssh_is_connected(ssh_) != 0;
        }

        [[nodiscard]] auto attach_event() noexcept -> bool
        {
            event_ = ssh_event_new();
            if (event_ == nullptr)
            {
                return false;
            }
            return ssh_event_add_session(event_, ssh_) == SSH_OK;
        }

        void detach_event() noexcept
        {
            if (event_ != nullptr)
            {
                if (ssh_ != nullptr)
                {
                    ssh_event_remove_session(event_, ssh_);
                }
                ssh_event_free(event_);
                event_ = nullptr;
            }
        }

        // handle whatever packets are already on the socket; never waits. caller holds mutex_
        void pump() noexcept
        {
            if (event_ != nullptr && ssh_event_dopoll(event_, 0) == SSH_ERROR)
            {
                log::debug("polling session failed: {}", ssh_get_error(ssh_));
            }
        }
    };

    namespace
    {

        // =============================================================================
        // RAII guard - closes and frees unless the session already did
        // =============================================================================

        struct channel_guard
        {
            ssh_channel channel{nullptr};

            channel_guard() = default;
            explicit channel_guard(ssh_channel c) : channel(c) {}
            ~channel_guard() { reset(false); }

            channel_guard(channel_guard const &) = delete;
            auto operator=(channel_guard const &) -> channel_guard & = delete;

            channel_guard(channel_guard &&other) noexcept : channel(other.channel) { other.channel = nullptr; }

            auto operator=(channel_guard &&other) noexcept -> channel_guard &
            {
                if (this != &other)
                {
                    reset(false);
                    channel = other.channel;
                    other.channel = nullptr;
                }
                return *this;
            }

            // session_gone: ssh_disconnect already freed the channel, just forget it
            void reset(bool session_gone) noexcept
            {
                if (channel != nullptr && !session_gone)
                {
                    ssh_channel_close(channel);
                    ssh_channel_free(channel);
                }
                channel = nullptr;
            }

            [[nodiscard]] auto get() const noexcept -> ssh_channel { return channel; }
            [[nodiscard]] explicit operator bool() const noexcept { return channel != nullptr; }
        };

        // =============================================================================
        // channel implementation
        // =============================================================================

        class libssh_channel final : public channel
        {
        public:
            libssh_channel(std::shared_ptr<libssh_connection::impl> owner, channel_guard guard)
                : owner_(std::move(owner)), channel_(std::move(guard))
            {
            }

            ~libssh_channel() override { close(); }

            libssh_channel(libssh_channel const &) = delete;
            auto operator=(libssh_channel const &) -> libssh_channel & = delete;
            libssh_channel(libssh_channel &&) = delete;
            auto operator=(libssh_channel &&) -> libssh_channel & = delete;

            auto request_pty(pty_request const &request) -> void_result override
            {
                std::lock_guard lock{owner_->mutex_};
                if (!alive())
                {
                    return std::unexpected(error_code::not_connected);
                }

                auto const rc = ssh_channel_request_pty_size_modes(
                    channel_.get(), request.term.c_str(), request.columns, request.rows,
                    request.encoded_modes.data(), request.encoded_modes.size());
                if (rc != SSH_OK)
                {
                    log::debug("pty request failed: {}", ssh_get_error(owner_->ssh_));
                    return std::unexpected(error_code::pty_request_failed);
                }
                return {};
            }

            auto exec(std::string_view command) -> void_result override
            {
                std::lock_guard lock{owner_->mutex_};
                if (!alive())
                {
                    return std::unexpected(error_code::not_connected);
                }

                if (ssh_channel_request_exec(channel_.get(), std::string(command).c_str()) != SSH_OK)
                {
                    log::debug("exec request failed: {}", ssh_get_error(owner_->ssh_));
                    return std::unexpected(error_code::exec_failed);
                }
                return {};
            }

            auto write(std::span<std::uint8_t const> data) -> result<std::size_t> override
            {
                std::lock_guard lock{owner_->mutex_};
                if (!alive())
                {
                    return std::unexpected(error_code::not_connected);
                }

                if (ssh_channel_is_closed(channel_.get()) != 0)
                {
                    return std::unexpected(error_code::write_failed);
                }

                // ssh_channel_write blocks until the peer opens its window for every byte,
                // so never hand it more than the window already allows
                auto window = ssh_channel_window_size(channel_.get());
                if (window == 0)
                {
                    owner_->pump();
                    window = ssh_channel_window_size(channel_.get());
                }
                if (window == 0)
                {
                    return std::size_t{0};
                }

                auto const count = static_cast<std::uint32_t>(std::min<std::size_t>(data.size(), window));
                auto const written = ssh_channel_write(channel_.get(), data.data(), count);
                if (written <= 0)
                {
                    return std::unexpected(error_code::write_failed);
                }
                return static_cast<std::size_t>(written);
            }

            auto send_eof() -> void_result override
            {
                std::lock_guard lock{owner_->mutex_};
                if (!alive())
                {
                    return std::unexpected(error_code::not_connected);
                }

                if (ssh_channel_send_eof(channel_.get()) != SSH_OK)
                {
                    return std::unexpected(error_code::eof_failed);
                }
                return {};
            }

            auto read(std::span<std::uint8_t> buffer, stream_id stream) -> result<std::size_t> override
            {
                std::lock_guard lock{owner_->mutex_};
                if (!alive())
                {
                    return std::unexpected(error_code::not_connected);
                }

                auto const count = static_cast<std::uint32_t>(
                    std::min<std::size_t>(buffer.size(), std::numeric_limits<std::uint32_t>::max()));
                auto const is_stderr = stream == stream_id::stderr_stream ? 1 : 0;
                auto const nbytes = ssh_channel_read_nonblocking(channel_.get(), buffer.data(), count, is_stderr);

                if (nbytes == SSH_EOF)
                {
                    return std::size_t{0};
                }
                if (nbytes < 0)
                {
                    return std::unexpected(error_code::read_failed);
                }
                return static_cast<std::size_t>(nbytes);
            }

            auto remote_eof() -> bool override
            {
                std::lock_guard lock{owner_->mutex_};
                if (!alive())
                {
                    return true;
                }
                return ssh_channel_is_eof(channel_.get()) != 0 || ssh_channel_is_closed(channel_.get()) != 0;
            }

            auto exit_status() -> result<std::optional<int>> override
            {
                std::lock_guard lock{owner_->mutex_};
                if (!alive())
                {
                    return std::unexpected(error_code::not_connected);
                }

                // exit-status precedes the close; before the close it may still be in flight
                if (ssh_channel_is_closed(channel_.get()) == 0)
                {
                    owner_->pump();
                    if (ssh_channel_is_closed(channel_.get()) == 0)
                    {
                        return std::optional<int>{};
                    }
                }

                // closed channel: returns at once
                auto const status = ssh_channel_get_exit_status(channel_.get());
                if (status < 0)
                {
                    return std::unexpected(error_code::exit_status_unavailable);
                }
                return std::optional<int>{status};
            }

            void close() noexcept override
            {
                std::lock_guard lock{owner_->mutex_};
                channel_.reset(owner_->disconnected_);
            }

        private:
            std::shared_ptr<libssh_connection::impl> owner_;
            channel_guard channel_;

            // caller holds the owner mutex
            [[nodiscard]] auto alive() const noexcept -> bool
            {
                return channel_ && !owner_->disconnected_;
            }
        };

    } // namespace

    // =============================================================================
    // connection
    // =============================================================================

    libssh_connection::libssh_connection(std::shared_ptr<impl> impl) : impl_(std::move(impl)) {}

    libssh_connection::~libssh_connection() = default;

    auto libssh_connection::connect(connection_config const &config) -> result<std::shared_ptr<libssh_connection>>
    {
        auto pimpl = std::make_shared<impl>();

        pimpl->ssh_ = ssh_new();
        if (pimpl->ssh_ == nullptr)
        {
            return std::unexpected(error_code::connection_failed);
        }

        pimpl->host_ = config.host;
        pimpl->user_ = config.username;
        pimpl->port_ = config.port;

        // set connection options
        auto timeout_secs = static_cast<long>(config.connect_timeout.count());
        bool options_ok = ssh_options_set(pimpl->ssh_, SSH_OPTIONS_HOST, config.host.c_str()) == SSH_OK &&
                          ssh_options_set(pimpl->ssh_, SSH_OPTIONS_PORT, &config.port) == SSH_OK &&
                          ssh_options_set(pimpl->ssh_, SSH_OPTIONS_TIMEOUT, &timeout_secs) == SSH_OK;
        if (options_ok && !config.username.empty())
        {
            options_ok = ssh_options_set(pimpl->ssh_, SSH_OPTIONS_USER, config.username.c_str()) == SSH_OK;
        }

        if (options_ok && config.verbosity > 0)
        {
            int verbosity = SSH_LOG_PROTOCOL;
            options_ok = ssh_options_set(pimpl->ssh_, SSH_OPTIONS_LOG_VERBOSITY, &verbosity) == SSH_OK;
        }

        if (options_ok && !config.strict_host_key_checking)
        {
            // accept any host key - use only for development/testing!
            int strict = 0;
            options_ok = ssh_options_set(pimpl->ssh_, SSH_OPTIONS_STRICTHOSTKEYCHECK, &strict) == SSH_OK;
        }

        if (!options_ok)
        {
            log::info("invalid connection options: {}", ssh_get_error(pimpl->ssh_));
            return std::unexpected(error_code::invalid_argument);
        }

        log::info("connecting to {}:{}", config.host, config.port);
        if (ssh_connect(pimpl->ssh_) != SSH_OK)
        {
            log::info("connection failed: {}", ssh_get_error(pimpl->ssh_));
            return std::unexpected(error_code::connection_failed);
        }

        if (config.strict_host_key_checking)
        {
            auto state = ssh_session_is_known_server(pimpl->ssh_);
            if (state != SSH_KNOWN_HOSTS_OK)
            {
                return std::unexpected(error_code::host_key_verification_failed);
            }
        }

        bool authenticated = false;

        // try key-based auth first
        if (!config.private_key_path.empty())
        {
            ssh_key key = nullptr;
            auto const *passphrase =
                config.private_key_passphrase.empty() ? nullptr : config.private_key_passphrase.c_str();
            auto rc = ssh_pki_import_privkey_file(config.private_key_path.c_str(), passphrase, nullptr, nullptr, &key);

            if (rc == SSH_OK && key != nullptr)
            {
                rc = ssh_userauth_publickey(pimpl->ssh_, nullptr, key);
                ssh_key_free(key);
                authenticated = rc == SSH_AUTH_SUCCESS;
            }
        }

        // default keys and agent
        if (!authenticated)
        {
            authenticated = ssh_userauth_publickey_auto(pimpl->ssh_, nullptr, nullptr) == SSH_AUTH_SUCCESS;
        }

        // password auth as last resort
        if (!authenticated && !config.password.empty())
        {
            authenticated = ssh_userauth_password(pimpl->ssh_, nullptr, config.password.c_str()) == SSH_AUTH_SUCCESS;
        }

        if (!authenticated)
        {
            return std::unexpected(error_code::authentication_failed);
        }

        if (!pimpl->attach_event())
        {
            return std::unexpected(error_code::connection_failed);
        }

        return std::shared_ptr<libssh_connection>(new libssh_connection(std::move(pimpl)));
    }

    auto libssh_connection::adopt(ssh_session_struct *session) -> result<std::shared_ptr<libssh_connection>>
    {
        if (session == nullptr || ssh_is_connected(session) == 0)
        {
            return std::unexpected(error_code::not_connected);
        }

        auto pimpl = std::make_shared<impl>();
        pimpl->ssh_ = session;

        char *host = nullptr;
        if (ssh_options_get(session, SSH_OPTIONS_HOST, &host) == SSH_OK && host != nullptr)
        {
            pimpl->host_ = host;
            ssh_string_free_char(host);
        }
        char *user = nullptr;
        if (ssh_options_get(session, SSH_OPTIONS_USER, &user) == SSH_OK && user != nullptr)
        {
            pimpl->user_ = user;
            ssh_string_free_char(user);
        }
        unsigned int port = 22;
        if (ssh_options_get_port(session, &port) == SSH_OK)
        {
            pimpl->port_ = static_cast<int>(port);
        }

        if (!pimpl->attach_event())
        {
            // the caller still owns the session
            pimpl->detach_event();
            pimpl->ssh_ = nullptr;
            return std::unexpected(error_code::connection_failed);
        }

        return std::shared_ptr<libssh_connection>(new libssh_connection(std::move(pimpl)));
    }

    auto libssh_connection::open_channel() -> result<std::unique_ptr<channel>>
    {
        std::lock_guard lock{impl_->mutex_};
        if (!impl_->usable())
        {
            return std::unexpected(error_code::not_connected);
        }

        channel_guard guard{ssh_channel_new(impl_->ssh_)};
        if (!guard)
        {
            return std::unexpected(error_code::session_open_failed);
        }

        if (ssh_channel_open_session(guard.get()) != SSH_OK)
        {
            log::debug("channel open failed: {}", ssh_get_error(impl_->ssh_));
            return std::unexpected(error_code::session_open_failed);
        }

        return std::make_unique<libssh_channel>(impl_, std::move(guard));
    }

    auto libssh_connection::is_connected() const noexcept -> bool
    {
        std::lock_guard lock{impl_->mutex_};
        return impl_->usable();
    }

    void libssh_connection::disconnect()
    {
        std::lock_guard lock{impl_->mutex_};
        if (impl_->ssh_ != nullptr && !impl_->disconnected_)
        {
            ssh_disconnect(impl_->ssh_);
            impl_->disconnected_ = true;
        }
    }

    auto libssh_connection::host() const noexcept -> std::string_view
    {
        return impl_->host_;
    }

    auto libssh_connection::user() const noexcept -> std::string_view
    {
        return impl_->user_;
    }

    auto libssh_connection::port() const noexcept -> int
    {
        return impl_->port_;
    }

} // namespace sshcomm
