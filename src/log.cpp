// log.cpp - level handling and the single write path to stderr

#include "sshcomm/log.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace sshcomm::log
{

    namespace
    {

        [[nodiscard]] auto level_from_environment() noexcept -> level
        {
            char const *value = std::getenv("SSHCOMM_LOG");
            if (value == nullptr)
            {
                return level::quiet;
            }
            return parse_level(value);
        }

        [[nodiscard]] auto level_storage() noexcept -> std::atomic<level> &
        {
            static std::atomic<level> storage{level_from_environment()};
            return storage;
        }

        [[nodiscard]] constexpr auto tag(level lvl) noexcept -> std::string_view
        {
            switch (lvl)
            {
            case level::info:
                return "info";
            case level::debug:
                return "debug";
            case level::quiet:
                break;
            }
            return "";
        }

        // worker threads log too; keep lines whole
        std::mutex g_write_mutex;

    } // namespace

    auto current_level() noexcept -> level
    {
        return level_storage().load(std::memory_order_relaxed);
    }

    void set_level(level lvl) noexcept
    {
        level_storage().store(lvl, std::memory_order_relaxed);
    }

    auto parse_level(std::string_view text) noexcept -> level
    {
        if (text == "2" || text == "debug")
        {
            return level::debug;
        }
        if (text == "1" || text == "info")
        {
            return level::info;
        }
        return level::quiet;
    }

    auto level_from_verbosity(int verbosity) noexcept -> level
    {
        if (verbosity >= 2)
        {
            return level::debug;
        }
        if (verbosity == 1)
        {
            return level::info;
        }
        return level::quiet;
    }

    void write(level lvl, std::string_view message)
    {
        std::lock_guard lock{g_write_mutex};
        fmt::print(stderr, "[sshcomm][{}] {}\n", tag(lvl), message);
    }

} // namespace sshcomm::log
