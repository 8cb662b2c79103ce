// vdfpatch_commit.hpp - vdfpatch - Atomic commit writer
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef VDFPATCH_COMMIT_HPP
#define VDFPATCH_COMMIT_HPP

#include "vdfpatch_core.hpp"
#include "vdfpatch_log.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <chrono>
#include <ctime>
#include <fstream>
#include <functional>
#include <iterator>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace vdfpatch
{
//========================================================================
// COMMIT API
//========================================================================

    enum class backup_policy
    {
        timestamped,    // <file>.backup_<timestamp>
        fixed_suffix    // <file><backup_suffix>
    };

    struct commit_options
    {
        backup_policy backup           = backup_policy::timestamped;
        std::string   backup_suffix    = ".backup";
        std::string   timestamp_format = "%Y%m%d_%H%M%S";
        bool          verify           = true;
        bool          sync             = true;

        // Called with the staged file just before the swap. Returning false
        // abandons the commit; the original is left as it was.
        std::function<bool(std::filesystem::path const &)> before_swap;
    };

    // Substrings the committed file must contain to count as verified.
    struct verification
    {
        std::vector<std::string> expected;
    };

    patch_result commit(std::filesystem::path const & target, std::string_view text,
                        verification const & check = {}, commit_options const & opts = {});

    // Whole-file read; nullopt when the file cannot be opened or read.
    std::optional<std::string> read_document(std::filesystem::path const & path, std::error_code & ec);

    std::filesystem::path backup_path_for(std::filesystem::path const & target, commit_options const & opts);

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        inline std::string errno_text(int errnum)
        {
            return std::string(std::strerror(errnum));
        }

        inline std::string format_now(std::string const & fmt)
        {
            auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm tm{};
            localtime_r(&t, &tm);
            char buf[64];
            size_t n = std::strftime(buf, sizeof(buf), fmt.c_str(), &tm);
            return std::string(buf, n);
        }

        inline error<patch_error_kind> make_error(patch_error_kind kind, std::string message)
        {
            return error<patch_error_kind>{ kind, std::move(message), npos() };
        }

        // Creates <dir>/<name>.tmp.XXXXXX; returns the path and an open fd.
        inline std::optional<std::pair<std::string, int>>
        create_staging_file(std::filesystem::path const & target, std::string & why)
        {
            auto parent = target.parent_path();
            std::string dir = parent.empty() ? std::string(".") : parent.string();
            std::string tmpl = dir + "/" + target.filename().string() + ".tmp.XXXXXX";

            std::vector<char> buf(tmpl.begin(), tmpl.end());
            buf.push_back('\0');

            int fd = ::mkstemp(buf.data());
            if (fd == -1)
            {
                why = "cannot create staging file '" + tmpl + "': " + errno_text(errno);
                return std::nullopt;
            }
            return std::pair{ std::string(buf.data()), fd };
        }

        // Writes, matches the target's mode, fsyncs and closes. The fd is
        // closed on every path; the staged file is left for the caller.
        inline bool write_staging_file(int fd, std::string_view text, std::filesystem::path const & target,
                                       bool sync, std::string & why)
        {
            size_t written = 0;
            while (written < text.size())
            {
                ssize_t n = ::write(fd, text.data() + written, text.size() - written);
                if (n < 0)
                {
                    if (errno == EINTR)
                        continue;
                    why = "write failed: " + errno_text(errno);
                    ::close(fd);
                    return false;
                }
                written += static_cast<size_t>(n);
            }

            struct stat st;
            if (::stat(target.c_str(), &st) == 0 && ::fchmod(fd, st.st_mode & 07777) != 0)
            {
                why = "fchmod failed: " + errno_text(errno);
                ::close(fd);
                return false;
            }

            if (sync && ::fsync(fd) != 0)
            {
                why = "fsync failed: " + errno_text(errno);
                ::close(fd);
                return false;
            }

            if (::close(fd) != 0)
            {
                why = "close failed: " + errno_text(errno);
                return false;
            }
            return true;
        }

        inline bool sync_directory(std::filesystem::path const & dir, std::string & why)
        {
            std::string d = dir.empty() ? std::string(".") : dir.string();
            int dfd = ::open(d.c_str(), O_RDONLY | O_DIRECTORY);
            if (dfd == -1)
            {
                why = "cannot open directory '" + d + "': " + errno_text(errno);
                return false;
            }
            bool ok = ::fsync(dfd) == 0;
            if (!ok)
                why = "directory fsync failed: " + errno_text(errno);
            ::close(dfd);
            return ok;
        }

        inline void discard(std::string const & staged)
        {
            if (::unlink(staged.c_str()) != 0 && errno != ENOENT)
                VDFPATCH_LOG_WARN("commit", "could not remove staging file '" + staged + "': " + errno_text(errno));
        }
    }

//========================================================================
// Commit API implementation
//========================================================================

    inline std::optional<std::string> read_document(std::filesystem::path const & path, std::error_code & ec)
    {
        namespace fs = std::filesystem;
        ec.clear();

        // The stream does not report why it failed; ask the filesystem.
        auto st = fs::status(path, ec);
        if (st.type() == fs::file_type::not_found)
        {
            ec = std::make_error_code(std::errc::no_such_file_or_directory);
            return std::nullopt;
        }
        if (ec)
            return std::nullopt;
        if (st.type() == fs::file_type::directory)
        {
            ec = std::make_error_code(std::errc::is_a_directory);
            return std::nullopt;
        }

        errno = 0;
        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in)
        {
            int err = errno;
            ec = err != 0 ? std::error_code(err, std::generic_category())
                          : std::make_error_code(std::errc::io_error);
            return std::nullopt;
        }

        std::ostringstream ss;
        ss << in.rdbuf();
        if (in.bad())
        {
            ec = std::make_error_code(std::errc::io_error);
            return std::nullopt;
        }
        return ss.str();
    }

    inline std::filesystem::path backup_path_for(std::filesystem::path const & target, commit_options const & opts)
    {
        std::string base = target.string();

        if (opts.backup == backup_policy::fixed_suffix)
            return std::filesystem::path(base + opts.backup_suffix);

        std::string stamped = base + opts.backup_suffix + "_" + detail::format_now(opts.timestamp_format);
        std::filesystem::path candidate(stamped);

        // Never overwrite an earlier backup taken within the same second.
        std::error_code ec;
        for (int n = 1; std::filesystem::exists(candidate, ec); ++n)
            candidate = std::filesystem::path(stamped + "_" + std::to_string(n));

        return candidate;
    }

    inline patch_result commit(std::filesystem::path const & target, std::string_view text,
                               verification const & check, commit_options const & opts)
    {
        namespace fs = std::filesystem;
        patch_result res;

        // Step 1: backup, best effort
        {
            fs::path backup = backup_path_for(target, opts);
            std::error_code ec;
            fs::copy_file(target, backup, fs::copy_options::overwrite_existing, ec);
            if (ec)
            {
                std::string msg = "could not back up '" + target.string() + "' to '"
                    + backup.string() + "': " + ec.message();
                VDFPATCH_LOG_WARN("commit", msg);
                res.warnings.push_back(detail::make_error(patch_error_kind::backup_failed, msg));
            }
            else
            {
                VDFPATCH_LOG_INFO("commit", "backed up original to '" + backup.string() + "'");
                res.backup_path = backup;
            }
        }

        // Step 2: stage next to the target
        std::string why;
        auto staged = detail::create_staging_file(target, why);
        if (!staged)
        {
            VDFPATCH_LOG_ERROR("commit", why);
            res.diagnostic = detail::make_error(patch_error_kind::write_failed, why);
            return res;
        }

        auto const & [staged_path, fd] = *staged;

        if (!detail::write_staging_file(fd, text, target, opts.sync, why))
        {
            detail::discard(staged_path);
            why = "staging '" + staged_path + "': " + why;
            VDFPATCH_LOG_ERROR("commit", why);
            res.diagnostic = detail::make_error(patch_error_kind::write_failed, why);
            return res;
        }

        if (opts.before_swap && !opts.before_swap(fs::path(staged_path)))
        {
            detail::discard(staged_path);
            why = "commit of '" + target.string() + "' interrupted before swap";
            VDFPATCH_LOG_ERROR("commit", why);
            res.diagnostic = detail::make_error(patch_error_kind::write_failed, why);
            return res;
        }

        // Step 3: swap
        if (std::rename(staged_path.c_str(), target.c_str()) != 0)
        {
            why = "rename '" + staged_path + "' -> '" + target.string() + "' failed: " + detail::errno_text(errno);
            detail::discard(staged_path);
            VDFPATCH_LOG_ERROR("commit", why);
            res.diagnostic = detail::make_error(patch_error_kind::write_failed, why);
            return res;
        }

        if (opts.sync && !detail::sync_directory(target.parent_path(), why))
        {
            VDFPATCH_LOG_WARN("commit", why);
            res.notes.push_back(why);
        }

        res.new_document = std::string(text);

        // Step 4: verify against what is actually on disk
        if (opts.verify)
        {
            std::error_code ec;
            auto on_disk = read_document(target, ec);

            std::string missing;
            if (!on_disk)
            {
                missing = "could not re-read '" + target.string() + "': " + ec.message();
            }
            else
            {
                for (auto const & token : check.expected)
                {
                    if (on_disk->find(token) == std::string::npos)
                    {
                        missing = "'" + token + "' not found in '" + target.string() + "' after swap";
                        break;
                    }
                }
            }

            if (!missing.empty())
            {
                if (res.backup_path)
                    missing += "; original content is in '" + res.backup_path->string() + "'";
                VDFPATCH_LOG_ERROR("commit", missing);
                res.status     = patch_status::written_unverified;
                res.diagnostic = detail::make_error(patch_error_kind::verification_failed, missing);
                return res;
            }
        }

        res.success = true;
        res.status  = patch_status::applied;
        return res;
    }

} // namespace vdfpatch

#endif // VDFPATCH_COMMIT_HPP
