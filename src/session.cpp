// session.cpp - per-operation channel wrapper and stream pump

#include "sshcomm/session.hpp"

#include "sshcomm/log.hpp"

#include <algorithm>
#include <istream>
#include <ostream>
#include <thread>

namespace sshcomm
{

    auto write_all(channel &ch, std::span<std::uint8_t const> data, std::chrono::milliseconds retry_interval)
        -> void_result
    {
        while (!data.empty())
        {
            auto const written = ch.write(data);
            if (!written.has_value())
            {
                return std::unexpected(written.error());
            }
            if (*written == 0)
            {
                // window full; a remote that already hung up will never open it
                if (ch.remote_eof())
                {
                    return std::unexpected(error_code::write_failed);
                }
                std::this_thread::sleep_for(retry_interval);
                continue;
            }
            data = data.subspan(std::min(*written, data.size()));
        }
        return {};
    }

    auto pty_settings::to_request() const -> pty_request
    {
        return pty_request{term, columns, rows, modes.encode()};
    }

    // =============================================================================
    // stdin_pipe
    // =============================================================================

    stdin_pipe::~stdin_pipe()
    {
        if (channel_ != nullptr)
        {
            if (auto const closed = channel_->send_eof(); !closed.has_value())
            {
                log::debug("closing stdin pipe failed: {}", closed.error());
            }
        }
    }

    auto stdin_pipe::operator=(stdin_pipe &&other) noexcept -> stdin_pipe &
    {
        if (this != &other)
        {
            if (channel_ != nullptr)
            {
                if (auto const closed = channel_->send_eof(); !closed.has_value())
                {
                    log::debug("closing stdin pipe failed: {}", closed.error());
                }
            }
            channel_ = std::exchange(other.channel_, nullptr);
            retry_interval_ = other.retry_interval_;
        }
        return *this;
    }

    auto stdin_pipe::write(std::span<std::uint8_t const> data) -> void_result
    {
        if (channel_ == nullptr)
        {
            return std::unexpected(error_code::write_failed);
        }
        return write_all(*channel_, data, retry_interval_);
    }

    auto stdin_pipe::write(std::string_view data) -> void_result
    {
        return write(std::span<std::uint8_t const>{reinterpret_cast<std::uint8_t const *>(data.data()), data.size()});
    }

    auto stdin_pipe::close() && -> void_result
    {
        auto *ch = std::exchange(channel_, nullptr);
        if (ch == nullptr)
        {
            return std::unexpected(error_code::eof_failed);
        }
        return ch->send_eof();
    }

    // =============================================================================
    // session
    // =============================================================================

    session::session(std::unique_ptr<channel> ch, session_options const &options)
        : channel_(std::move(ch)), options_(options)
    {
        if (options_.io_chunk_size == 0)
        {
            options_.io_chunk_size = constants::default_io_chunk_size;
        }
    }

    session::~session()
    {
        close();
    }

    auto session::open(connection &conn, session_options const &options) -> result<session>
    {
        auto ch = conn.open_channel();
        if (!ch.has_value())
        {
            return std::unexpected(ch.error());
        }
        if (*ch == nullptr)
        {
            return std::unexpected(error_code::session_open_failed);
        }
        return session(std::move(*ch), options);
    }

    auto session::take_stdin_pipe() -> result<stdin_pipe>
    {
        if (channel_ == nullptr)
        {
            return std::unexpected(error_code::not_connected);
        }
        if (stdin_ != nullptr || pipe_taken_)
        {
            return std::unexpected(error_code::stdin_already_bound);
        }
        pipe_taken_ = true;
        return stdin_pipe{*channel_, options_.poll_interval};
    }

    auto session::request_pty(pty_settings const &settings) -> void_result
    {
        if (channel_ == nullptr)
        {
            return std::unexpected(error_code::not_connected);
        }
        return channel_->request_pty(settings.to_request());
    }

    auto session::start(std::string_view command) -> void_result
    {
        if (channel_ == nullptr)
        {
            return std::unexpected(error_code::not_connected);
        }
        if (started_)
        {
            return std::unexpected(error_code::exec_failed);
        }

        auto const executed = channel_->exec(command);
        if (!executed.has_value())
        {
            return executed;
        }
        started_ = true;
        return {};
    }

    auto session::read_byte(std::stop_token stop) -> result<std::uint8_t>
    {
        if (channel_ == nullptr)
        {
            return std::unexpected(error_code::not_connected);
        }

        std::uint8_t byte{0};
        while (true)
        {
            if (stop.stop_requested())
            {
                return std::unexpected(error_code::cancelled);
            }

            auto const nbytes = channel_->read(std::span<std::uint8_t>{&byte, 1}, stream_id::stdout_stream);
            if (!nbytes.has_value())
            {
                return std::unexpected(nbytes.error());
            }
            if (*nbytes == 1)
            {
                return byte;
            }
            // nothing buffered and nothing more coming
            if (channel_->remote_eof())
            {
                return std::unexpected(error_code::read_failed);
            }
            std::this_thread::sleep_for(options_.poll_interval);
        }
    }

    auto session::read_line(std::stop_token stop) -> result<std::string>
    {
        std::string line;
        while (true)
        {
            auto const byte = read_byte(stop);
            if (!byte.has_value())
            {
                return std::unexpected(byte.error());
            }
            if (*byte == '\n')
            {
                return line;
            }
            line.push_back(static_cast<char>(*byte));
        }
    }

    auto session::drain(stream_id stream, std::ostream *sink, byte_buffer &buffer) -> result<bool>
    {
        bool moved = false;
        while (true)
        {
            auto const nbytes = channel_->read(buffer, stream);
            if (!nbytes.has_value())
            {
                return std::unexpected(nbytes.error());
            }
            if (*nbytes == 0)
            {
                return moved;
            }
            moved = true;
            if (sink != nullptr)
            {
                sink->write(reinterpret_cast<char const *>(buffer.data()), static_cast<std::streamsize>(*nbytes));
            }
        }
    }

    auto session::wait(std::stop_token stop) -> void_result
    {
        if (channel_ == nullptr)
        {
            return std::unexpected(error_code::not_connected);
        }
        if (!started_)
        {
            return std::unexpected(error_code::invalid_argument);
        }

        byte_buffer buffer(options_.io_chunk_size);
        byte_buffer input(options_.io_chunk_size);

        // a pipe owner decides when stdin ends; otherwise we do
        bool stdin_done = pipe_taken_;
        if (!stdin_done && stdin_ == nullptr)
        {
            if (auto const eof = channel_->send_eof(); !eof.has_value())
            {
                log::debug("sending stdin EOF failed: {}", eof.error());
            }
            stdin_done = true;
        }

        while (true)
        {
            if (stop.stop_requested())
            {
                close();
                return std::unexpected(error_code::cancelled);
            }

            bool progress = false;

            if (!stdin_done)
            {
                stdin_->read(reinterpret_cast<char *>(input.data()), static_cast<std::streamsize>(input.size()));
                auto const count = static_cast<std::size_t>(stdin_->gcount());
                if (count > 0)
                {
                    progress = true;
                    auto const sent = write_all(*channel_, std::span<std::uint8_t const>{input.data(), count},
                                                options_.poll_interval);
                    if (!sent.has_value())
                    {
                        // remote stopped reading; keep collecting output
                        log::debug("forwarding stdin failed: {}", sent.error());
                        stdin_done = true;
                    }
                }
                if (!stdin_done && !stdin_->good())
                {
                    if (auto const eof = channel_->send_eof(); !eof.has_value())
                    {
                        log::debug("sending stdin EOF failed: {}", eof.error());
                    }
                    stdin_done = true;
                }
            }

            auto const out = drain(stream_id::stdout_stream, stdout_, buffer);
            if (!out.has_value())
            {
                return std::unexpected(out.error());
            }
            auto const err = drain(stream_id::stderr_stream, stderr_, buffer);
            if (!err.has_value())
            {
                return std::unexpected(err.error());
            }
            progress = progress || *out || *err;

            if (channel_->remote_eof())
            {
                break;
            }

            if (!progress)
            {
                std::this_thread::sleep_for(options_.poll_interval);
            }
        }

        // anything that arrived between the last drain and EOF
        for (auto const &[stream, sink] : {std::pair{stream_id::stdout_stream, stdout_},
                                           std::pair{stream_id::stderr_stream, stderr_}})
        {
            if (auto const rest = drain(stream, sink, buffer); !rest.has_value())
            {
                return std::unexpected(rest.error());
            }
        }

        if (stdout_ != nullptr)
        {
            stdout_->flush();
        }
        if (stderr_ != nullptr)
        {
            stderr_->flush();
        }

        // outputs are done, but the process may keep running until the channel closes
        while (true)
        {
            if (stop.stop_requested())
            {
                close();
                return std::unexpected(error_code::cancelled);
            }

            auto const status = channel_->exit_status();
            if (!status.has_value())
            {
                return std::unexpected(status.error());
            }
            if (status->has_value())
            {
                if (**status != 0)
                {
                    return std::unexpected(exit_error{**status});
                }
                return {};
            }
            std::this_thread::sleep_for(options_.poll_interval);
        }
    }

    void session::close() noexcept
    {
        if (channel_ != nullptr)
        {
            channel_->close();
            channel_.reset();
        }
    }

} // namespace sshcomm
