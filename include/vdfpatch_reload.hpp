// vdfpatch_reload.hpp - vdfpatch - External reload signal
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef VDFPATCH_RELOAD_HPP
#define VDFPATCH_RELOAD_HPP

#include "vdfpatch_core.hpp"
#include "vdfpatch_log.hpp"

#include <charconv>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iterator>
#include <new>

#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

namespace vdfpatch
{
//========================================================================
// RELOAD API
//========================================================================

    struct reload_options
    {
        bool touch         = true;
        bool send_signal   = true;
        int  signal_number = SIGHUP;
        std::filesystem::path proc_root = "/proc";
    };

    struct reload_report
    {
        bool                     touched {false};
        bool                     aborted {false};   // an error cut the run short
        std::vector<int>         signalled;
        std::vector<std::string> notes;
    };

    // Pids whose comm or argv[0] basename equals `name`, ignoring case.
    // The calling process is never included.
    std::vector<int> find_processes(std::string_view name, std::filesystem::path const & proc_root = "/proc");

    // Best effort: bumps the file's mtime and signals the owning process.
    // Failures only produce notes.
    reload_report notify(std::filesystem::path const & target, std::string_view owner_hint,
                         reload_options const & opts = {}) noexcept;

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        inline std::optional<std::string> read_small_file(std::filesystem::path const & p)
        {
            std::ifstream in(p, std::ios::in | std::ios::binary);
            if (!in)
                return std::nullopt;
            std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            return s;
        }

        // Decimal entry names that fit a pid; anything else is not a process.
        inline std::optional<int> parse_pid(std::string const & s)
        {
            if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c); }))
                return std::nullopt;

            int pid = 0;
            auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), pid);
            if (ec != std::errc() || end != s.data() + s.size())
                return std::nullopt;
            return pid;
        }

        // Adds a note without letting an allocation failure escape.
        inline void add_note(reload_report & report, std::string_view prefix, char const * what) noexcept
        {
            try
            {
                std::string note(prefix);
                note += what;
                report.notes.push_back(std::move(note));
            }
            catch (std::bad_alloc const &)
            {
                report.aborted = true;
            }
        }

        inline bool process_matches(std::filesystem::path const & dir, std::string const & wanted)
        {
            if (auto comm = read_small_file(dir / "comm"))
            {
                std::string c = *comm;
                while (!c.empty() && (c.back() == '\n' || c.back() == '\r'))
                    c.pop_back();
                if (to_lower(c) == wanted)
                    return true;
            }

            if (auto cmdline = read_small_file(dir / "cmdline"))
            {
                // argv[0] ends at the first NUL
                std::string argv0 = cmdline->substr(0, cmdline->find('\0'));
                if (!argv0.empty())
                {
                    std::string base = std::filesystem::path(argv0).filename().string();
                    if (to_lower(base) == wanted)
                        return true;
                }
            }

            return false;
        }
    }

//========================================================================
// Reload API implementation
//========================================================================

    inline std::vector<int> find_processes(std::string_view name, std::filesystem::path const & proc_root)
    {
        namespace fs = std::filesystem;
        std::vector<int> pids;

        std::string wanted = detail::to_lower(std::string(name));
        if (wanted.empty())
            return pids;

        std::error_code ec;
        fs::directory_iterator it(proc_root, ec), end;
        if (ec)
            return pids;

        int self = static_cast<int>(::getpid());

        for (; it != end; it.increment(ec))
        {
            if (ec)
                break;

            auto pid = detail::parse_pid(it->path().filename().string());
            if (!pid || *pid == self)
                continue;

            if (detail::process_matches(it->path(), wanted))
                pids.push_back(*pid);
        }

        return pids;
    }

    inline reload_report notify(std::filesystem::path const & target, std::string_view owner_hint,
                                reload_options const & opts) noexcept
    {
        namespace fs = std::filesystem;
        reload_report report;

        try
        {
            if (opts.touch)
            {
                std::error_code ec;
                fs::last_write_time(target, fs::file_time_type::clock::now(), ec);
                if (ec)
                    report.notes.push_back("could not update mtime of '" + target.string() + "': " + ec.message());
                else
                    report.touched = true;
            }

            if (opts.send_signal && !owner_hint.empty())
            {
                for (int pid : find_processes(owner_hint, opts.proc_root))
                {
                    if (::kill(static_cast<pid_t>(pid), opts.signal_number) == 0)
                        report.signalled.push_back(pid);
                    else
                        report.notes.push_back("could not signal pid " + std::to_string(pid) + ": " + std::strerror(errno));
                }

                if (report.signalled.empty())
                    report.notes.push_back("no running '" + std::string(owner_hint) + "' process was signalled");
            }

            for (auto const & note : report.notes)
                VDFPATCH_LOG_INFO("reload", note);
        }
        catch (std::exception const & e)
        {
            report.aborted = true;
            detail::add_note(report, "reload signal aborted: ", e.what());
        }
        catch (...)
        {
            report.aborted = true;
        }

        return report;
    }

} // namespace vdfpatch

#endif // VDFPATCH_RELOAD_HPP
