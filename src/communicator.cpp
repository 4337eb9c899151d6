// communicator.cpp - command start with background completion, scp sink upload

#include "sshcomm/communicator.hpp"

#include "sshcomm/log.hpp"
#include "sshcomm/scp_protocol.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wtautological-compare"
#include <fmt/ranges.h>
#pragma GCC diagnostic pop

#include <algorithm>
#include <array>
#include <fstream>
#include <istream>
#include <sstream>

namespace sshcomm
{

    namespace
    {

        [[nodiscard]] auto read_all(std::istream &source) -> result<byte_buffer>
        {
            // a failed extraction left data behind; reading on would frame an empty file
            if (source.fail() && !source.eof())
            {
                return std::unexpected(error_code::source_read_failed);
            }

            byte_buffer data;
            std::array<char, 8192> chunk{};

            while (source.read(chunk.data(), chunk.size()) || source.gcount() > 0)
            {
                auto const count = static_cast<std::size_t>(source.gcount());
                data.insert(data.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(count));
            }

            if (source.bad())
            {
                return std::unexpected(error_code::source_read_failed);
            }
            return data;
        }

        // one status byte, plus the message line that follows a non-zero byte
        [[nodiscard]] auto expect_ack(session &sess, std::string_view phase) -> void_result
        {
            auto const status = sess.read_byte();
            if (!status.has_value())
            {
                return std::unexpected(status.error());
            }

            std::string message;
            if (*status != 0)
            {
                auto line = sess.read_line();
                if (!line.has_value())
                {
                    return std::unexpected(line.error());
                }
                message = std::move(*line);
            }

            auto const parsed = scp::parse_ack(*status, message);
            if (!parsed.has_value())
            {
                log::info("scp receiver sent unexpected status byte {} after {}", *status, phase);
                return std::unexpected(parsed.error());
            }
            if (!parsed->is_ok())
            {
                log::info("scp receiver rejected {}: {}", phase, parsed->message);
                return std::unexpected(error_code::remote_rejected);
            }
            return {};
        }

    } // namespace

    communicator::communicator(std::shared_ptr<connection> conn, communicator_config config)
        : connection_(std::move(conn)), config_(std::move(config))
    {
    }

    communicator::~communicator()
    {
        std::lock_guard lock{workers_mutex_};
        for (auto &w : workers_)
        {
            w.thread.request_stop();
        }
        // jthread joins on destruction
        workers_.clear();
    }

    auto communicator::start(remote_command const &command) -> result<running_command>
    {
        if (command.command.empty())
        {
            return std::unexpected(error_code::invalid_argument);
        }
        if (connection_ == nullptr)
        {
            return std::unexpected(error_code::not_connected);
        }

        auto sess = session::open(*connection_, config_.io);
        if (!sess.has_value())
        {
            return std::unexpected(sess.error());
        }

        sess->bind_stdin(command.stdin_stream);
        sess->bind_stdout(command.stdout_stream);
        sess->bind_stderr(command.stderr_stream);

        if (auto const pty = sess->request_pty(config_.pty); !pty.has_value())
        {
            return std::unexpected(pty.error());
        }

        log::info("starting remote command: {}", command.command);
        // the remote shell needs the line terminator
        if (auto const started = sess->start(command.command + "\n"); !started.has_value())
        {
            return std::unexpected(started.error());
        }

        std::promise<int> promise;
        auto exit_status = promise.get_future().share();
        auto done = std::make_shared<std::atomic<bool>>(false);

        std::jthread thread{[active = std::move(*sess), promise = std::move(promise), done,
                             text = command.command](std::stop_token stop) mutable {
            auto const outcome = active.wait(stop);
            active.close();

            int status = 0;
            if (!outcome.has_value())
            {
                if (auto const code = exit_status_of(outcome.error()))
                {
                    status = *code;
                }
                else
                {
                    log::info("remote command '{}' did not complete cleanly: {}", text, outcome.error());
                }
            }
            log::debug("remote command '{}' exited with status {}", text, status);

            done->store(true, std::memory_order_release);
            promise.set_value(status);
        }};

        std::lock_guard lock{workers_mutex_};
        reap_finished_workers();
        workers_.push_back(worker{std::move(thread), std::move(done)});

        return running_command{std::move(exit_status)};
    }

    auto communicator::upload(std::string_view remote_path, std::istream &source) -> void_result
    {
        auto const target = scp::split_remote_path(remote_path);
        if (!target.has_value())
        {
            return std::unexpected(target.error());
        }
        if (connection_ == nullptr)
        {
            return std::unexpected(error_code::not_connected);
        }

        // diagnostics only; must outlive the session
        std::ostringstream stdout_capture;
        std::ostringstream stderr_capture;

        log::info("opening new SSH session");
        auto sess = session::open(*connection_, config_.io);
        if (!sess.has_value())
        {
            return std::unexpected(sess.error());
        }

        sess->bind_stdout(&stdout_capture);
        sess->bind_stderr(&stderr_capture);

        // declared after the session so it is released first
        auto pipe = sess->take_stdin_pipe();
        if (!pipe.has_value())
        {
            return std::unexpected(pipe.error());
        }

        log::info("starting remote scp process in sink mode");
        if (auto const started = sess->start(scp::sink_command(config_.sink_program, target->directory));
            !started.has_value())
        {
            return started;
        }
        if (config_.verify_acks)
        {
            if (auto const ready = expect_ack(*sess, "start"); !ready.has_value())
            {
                return ready;
            }
        }

        // the control line declares the length, so the whole input has to be known up front
        log::debug("copying input data into in-memory buffer so we can get the length");
        auto const payload = read_all(source);
        if (!payload.has_value())
        {
            return std::unexpected(payload.error());
        }

        auto const line = scp::control_line(config_.file_mode, payload->size(), target->filename);
        if (!line.has_value())
        {
            return std::unexpected(line.error());
        }

        log::info("beginning file upload of {} bytes to {}", payload->size(), remote_path);
        if (auto const sent = pipe->write(*line); !sent.has_value())
        {
            return sent;
        }
        if (config_.verify_acks)
        {
            if (auto const accepted = expect_ack(*sess, "control line"); !accepted.has_value())
            {
                return accepted;
            }
        }

        if (auto const sent = pipe->write(*payload); !sent.has_value())
        {
            return sent;
        }
        std::array<std::uint8_t, 1> const marker{scp::end_of_file_marker};
        if (auto const sent = pipe->write(marker); !sent.has_value())
        {
            return sent;
        }
        if (config_.verify_acks)
        {
            if (auto const stored = expect_ack(*sess, "file data"); !stored.has_value())
            {
                return stored;
            }
        }

        log::info("upload complete, closing stdin pipe");
        if (auto const closed = std::move(*pipe).close(); !closed.has_value())
        {
            return closed;
        }

        log::info("waiting for SSH session to complete");
        auto const finished = sess->wait();

        auto const out = std::move(stdout_capture).str();
        auto const err = std::move(stderr_capture).str();
        if (!finished.has_value())
        {
            if (auto const status = exit_status_of(finished.error()))
            {
                log::info("non-zero exit status: {}", *status);
            }
            log::info("scp stderr (length {}): {}", err.size(), err);
            return finished;
        }

        log::debug("scp stdout (length {}): {:02x}", out.size(),
                   fmt::join(std::span{reinterpret_cast<std::uint8_t const *>(out.data()), out.size()}, " "));
        log::debug("scp stderr (length {}): {}", err.size(), err);
        return {};
    }

    auto communicator::upload_file(std::string_view remote_path, std::filesystem::path const &local_path)
        -> void_result
    {
        std::ifstream file(local_path, std::ios::binary);
        if (!file)
        {
            return std::unexpected(error_code::file_open_failed);
        }
        return upload(remote_path, file);
    }

    void communicator::download(std::string_view remote_path, std::ostream & /*destination*/)
    {
        throw not_implemented_error{fmt::format("download of '{}' is not implemented", remote_path)};
    }

    auto communicator::active_commands() const -> std::size_t
    {
        std::lock_guard lock{workers_mutex_};
        return static_cast<std::size_t>(std::ranges::count_if(
            workers_, [](worker const &w) { return !w.done->load(std::memory_order_acquire); }));
    }

    void communicator::reap_finished_workers()
    {
        std::erase_if(workers_, [](worker const &w) { return w.done->load(std::memory_order_acquire); });
    }

} // namespace sshcomm
