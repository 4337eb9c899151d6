#pragma once

// communicator.hpp - run commands and upload files over an established connection

#include "session.hpp"
#include "transport.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace sshcomm
{

    // =============================================================================
    // configuration
    // =============================================================================

    struct communicator_config
    {
        pty_settings pty{};
        std::string sink_program{"scp"};
        std::uint32_t file_mode{constants::default_file_mode};
        bool verify_acks{false}; // read the receiver's status byte after each upload phase
        session_options io{};
    };

    // =============================================================================
    // remote command
    // =============================================================================

    // streams are borrowed; null means no input / output discarded.
    // they must stay alive until the command has exited
    struct remote_command
    {
        std::string command;
        std::istream *stdin_stream{nullptr};
        std::ostream *stdout_stream{nullptr};
        std::ostream *stderr_stream{nullptr};
    };

    // handle to a started command; the exit status is published exactly once
    class running_command
    {
    private:
        std::shared_future<int> exit_status_{};

    public:
        running_command() = default;
        explicit running_command(std::shared_future<int> exit_status) noexcept
            : exit_status_(std::move(exit_status))
        {
        }

        [[nodiscard]] auto valid() const noexcept -> bool { return exit_status_.valid(); }

        // non-blocking
        [[nodiscard]] auto exited() const -> bool
        {
            return valid() && exit_status_.wait_for(std::chrono::seconds{0}) == std::future_status::ready;
        }

        // blocks until the command exited
        [[nodiscard]] auto wait() const -> int { return exit_status_.get(); }

        template <typename Rep, typename Period>
        [[nodiscard]] auto wait_for(std::chrono::duration<Rep, Period> const &timeout) const -> std::optional<int>
        {
            if (!valid() || exit_status_.wait_for(timeout) != std::future_status::ready)
            {
                return std::nullopt;
            }
            return exit_status_.get();
        }

        // nullopt until exited
        [[nodiscard]] auto exit_status() const -> std::optional<int>
        {
            return wait_for(std::chrono::seconds{0});
        }
    };

    // =============================================================================
    // communicator
    // =============================================================================

    class communicator
    {
    public:
        explicit communicator(std::shared_ptr<connection> conn, communicator_config config = {});

        // stops and joins command workers still running
        ~communicator();

        communicator(communicator const &) = delete;
        auto operator=(communicator const &) -> communicator & = delete;
        communicator(communicator &&) = delete;
        auto operator=(communicator &&) -> communicator & = delete;

        /// @brief Start a command in its own pty session and return once the remote accepted it
        /// setup failures are returned here; the exit status arrives through running_command
        [[nodiscard]] auto start(remote_command const &command) -> result<running_command>;

        /// @brief Upload the whole of source to remote_path (mode from config, 0644 by default)
        /// source is buffered in memory first
        [[nodiscard]] auto upload(std::string_view remote_path, std::istream &source) -> void_result;

        [[nodiscard]] auto upload_file(std::string_view remote_path, std::filesystem::path const &local_path)
            -> void_result;

        /// @brief Not implemented; always throws not_implemented_error
        [[noreturn]] void download(std::string_view remote_path, std::ostream &destination);

        [[nodiscard]] auto config() const noexcept -> communicator_config const & { return config_; }

        // commands whose completion has not been published yet
        [[nodiscard]] auto active_commands() const -> std::size_t;

    private:
        struct worker
        {
            std::jthread thread;
            std::shared_ptr<std::atomic<bool>> done;
        };

        std::shared_ptr<connection> connection_;
        communicator_config config_;

        mutable std::mutex workers_mutex_;
        std::vector<worker> workers_;

        // caller holds workers_mutex_
        void reap_finished_workers();
    };

} // namespace sshcomm
