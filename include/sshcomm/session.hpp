#pragma once

// session.hpp - one remote command over one channel, closed when it goes out of scope

#include "terminal_modes.hpp"
#include "transport.hpp"

#include <chrono>
#include <iosfwd>
#include <memory>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

namespace sshcomm
{

    struct pty_settings
    {
        std::string term{"xterm"};
        int columns{constants::default_pty_columns};
        int rows{constants::default_pty_rows};
        terminal_modes modes{terminal_modes::defaults()};

        [[nodiscard]] auto to_request() const -> pty_request;
    };

    struct session_options
    {
        std::size_t io_chunk_size{constants::default_io_chunk_size};
        std::chrono::milliseconds poll_interval{10};
    };

    // =============================================================================
    // stdin pipe - write end of the remote process' standard input
    // =============================================================================

    // single use: close() consumes the pipe, the destructor only closes a pipe
    // nobody closed. must not outlive the session it came from.
    class stdin_pipe
    {
    private:
        channel *channel_{nullptr};
        std::chrono::milliseconds retry_interval_{10};

    public:
        stdin_pipe() noexcept = default;
        stdin_pipe(channel &ch, std::chrono::milliseconds retry_interval) noexcept
            : channel_(&ch), retry_interval_(retry_interval)
        {
        }
        ~stdin_pipe();

        stdin_pipe(stdin_pipe const &) = delete;
        auto operator=(stdin_pipe const &) -> stdin_pipe & = delete;
        stdin_pipe(stdin_pipe &&other) noexcept
            : channel_(std::exchange(other.channel_, nullptr)), retry_interval_(other.retry_interval_)
        {
        }
        auto operator=(stdin_pipe &&other) noexcept -> stdin_pipe &;

        // writes everything or fails; waits out a full remote window
        [[nodiscard]] auto write(std::span<std::uint8_t const> data) -> void_result;
        [[nodiscard]] auto write(std::string_view data) -> void_result;

        // sends EOF; usable as std::move(pipe).close()
        [[nodiscard]] auto close() && -> void_result;

        [[nodiscard]] auto is_open() const noexcept -> bool { return channel_ != nullptr; }
    };

    // =============================================================================
    // session
    // =============================================================================

    class session
    {
    public:
        ~session();

        session(session const &) = delete;
        auto operator=(session const &) -> session & = delete;
        session(session &&) noexcept = default;
        auto operator=(session &&) noexcept -> session & = default;

        [[nodiscard]] static auto open(connection &conn, session_options const &options = {}) -> result<session>;

        // stream binding; null unbinds. streams must outlive wait()
        void bind_stdin(std::istream *in) noexcept { stdin_ = in; }
        void bind_stdout(std::ostream *out) noexcept { stdout_ = out; }
        void bind_stderr(std::ostream *err) noexcept { stderr_ = err; }

        // fails with stdin_already_bound if a stream is bound or a pipe was taken
        [[nodiscard]] auto take_stdin_pipe() -> result<stdin_pipe>;

        [[nodiscard]] auto request_pty(pty_settings const &settings) -> void_result;
        [[nodiscard]] auto start(std::string_view command) -> void_result;

        // blocking single byte from the remote stdout, for protocol handshakes
        [[nodiscard]] auto read_byte(std::stop_token stop = {}) -> result<std::uint8_t>;
        // up to and excluding '\n'
        [[nodiscard]] auto read_line(std::stop_token stop = {}) -> result<std::string>;

        // pumps bound streams until the remote command ends and the channel is closed.
        // ok on exit status 0, exit_error on non-zero, error_code otherwise.
        // a stop request closes the channel and yields error_code::cancelled
        [[nodiscard]] auto wait(std::stop_token stop = {}) -> void_result;

        void close() noexcept;
        [[nodiscard]] auto is_open() const noexcept -> bool { return channel_ != nullptr; }
        [[nodiscard]] auto started() const noexcept -> bool { return started_; }

    private:
        std::unique_ptr<channel> channel_;
        session_options options_;
        std::istream *stdin_{nullptr};
        std::ostream *stdout_{nullptr};
        std::ostream *stderr_{nullptr};
        bool pipe_taken_{false};
        bool started_{false};

        session(std::unique_ptr<channel> ch, session_options const &options);

        [[nodiscard]] auto drain(stream_id stream, std::ostream *sink, byte_buffer &buffer) -> result<bool>;
    };

    // sleeps retry_interval whenever the remote window is full; fails once the remote is gone
    [[nodiscard]] auto write_all(channel &ch, std::span<std::uint8_t const> data,
                                 std::chrono::milliseconds retry_interval) -> void_result;

} // namespace sshcomm
