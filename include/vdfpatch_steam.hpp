// vdfpatch_steam.hpp - vdfpatch - Steam installation helpers
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef VDFPATCH_STEAM_HPP
#define VDFPATCH_STEAM_HPP

#include "vdfpatch_core.hpp"
#include "vdfpatch_escape.hpp"
#include "vdfpatch_commit.hpp"
#include "vdfpatch_log.hpp"

#include <cstdlib>

namespace vdfpatch::steam
{
//========================================================================
// STEAM API
//========================================================================

    // Record path of an application's block in localconfig.vdf.
    inline std::vector<std::string> app_record_path(std::string const & app_id)
    {
        return { "apps", app_id };
    }

    inline constexpr std::string_view LAUNCH_OPTIONS_FIELD = "LaunchOptions";
    inline constexpr std::string_view OWNER_PROCESS        = "steam";

    // Known install locations, most common first.
    std::vector<std::filesystem::path> candidate_roots(std::filesystem::path const & home);

    std::optional<std::filesystem::path> find_steam_root(std::filesystem::path const & home);
    std::optional<std::filesystem::path> find_steam_root();

    // localconfig.vdf of the most recently modified numeric userdata entry.
    std::optional<std::filesystem::path> find_localconfig(std::filesystem::path const & root);

    // The root followed by each "path" in steamapps/libraryfolders.vdf,
    // in document order, without duplicates.
    std::vector<std::filesystem::path> library_folders(std::filesystem::path const & root);

//========================================================================
// Steam API implementation
//========================================================================

    inline std::vector<std::filesystem::path> candidate_roots(std::filesystem::path const & home)
    {
        return {
            home / ".steam" / "steam",
            home / ".local" / "share" / "Steam",
            "/usr/share/steam",
            home / ".steam" / "root",
            home / "snap" / "steam" / "common" / ".steam" / "steam",
            "/var/lib/flatpak/app/com.valvesoftware.Steam/home/.steam/steam",
            home / ".var" / "app" / "com.valvesoftware.Steam" / "home" / ".steam" / "steam",
        };
    }

    inline std::optional<std::filesystem::path> find_steam_root(std::filesystem::path const & home)
    {
        for (auto const & candidate : candidate_roots(home))
        {
            std::error_code ec;
            if (std::filesystem::exists(candidate, ec))
            {
                VDFPATCH_LOG_DEBUG("steam", "found Steam at '" + candidate.string() + "'");
                return candidate;
            }
        }

        VDFPATCH_LOG_WARN("steam", "Steam installation not found in standard locations");
        return std::nullopt;
    }

    inline std::optional<std::filesystem::path> find_steam_root()
    {
        char const * home = std::getenv("HOME");
        if (home == nullptr || *home == '\0')
        {
            VDFPATCH_LOG_WARN("steam", "HOME is not set");
            return std::nullopt;
        }
        return find_steam_root(std::filesystem::path(home));
    }

    inline std::optional<std::filesystem::path> find_localconfig(std::filesystem::path const & root)
    {
        namespace fs = std::filesystem;

        fs::path userdata = root / "userdata";
        std::error_code ec;
        fs::directory_iterator it(userdata, ec), end;
        if (ec)
        {
            VDFPATCH_LOG_WARN("steam", "no userdata directory at '" + userdata.string() + "'");
            return std::nullopt;
        }

        std::optional<fs::path>   newest;
        fs::file_time_type        newest_time{};

        for (; it != end; it.increment(ec))
        {
            if (ec)
                break;

            std::error_code sub;
            if (!it->is_directory(sub))
                continue;

            std::string name = it->path().filename().string();
            if (name.empty() || !std::all_of(name.begin(), name.end(), [](unsigned char c){ return std::isdigit(c); }))
                continue;

            auto t = fs::last_write_time(it->path(), sub);
            if (sub)
                continue;

            if (!newest || t > newest_time)
            {
                newest      = it->path();
                newest_time = t;
            }
        }

        if (!newest)
        {
            VDFPATCH_LOG_WARN("steam", "no user directories under '" + userdata.string() + "'");
            return std::nullopt;
        }

        fs::path config = *newest / "config" / "localconfig.vdf";
        if (!fs::exists(config, ec))
        {
            VDFPATCH_LOG_WARN("steam", "'" + config.string() + "' does not exist");
            return std::nullopt;
        }

        return config;
    }

    inline std::vector<std::filesystem::path> library_folders(std::filesystem::path const & root)
    {
        std::vector<std::filesystem::path> out { root };

        std::error_code ec;
        auto text = read_document(root / "steamapps" / "libraryfolders.vdf", ec);
        if (!text)
            return out;

        std::string_view doc = *text;
        constexpr std::string_view needle = "\"path\"";
        size_t pos = 0;

        while ((pos = doc.find(needle, pos)) != std::string_view::npos)
        {
            size_t q = doc.find_first_not_of(detail::WHITESPACE, pos + needle.size());
            pos += needle.size();

            if (q == std::string_view::npos || doc[q] != '"')
                continue;

            size_t len = quoted_length(doc, q + 1);
            if (len == npos())
                break;

            std::filesystem::path lib(decode(doc.substr(q + 1, len)));
            if (std::find(out.begin(), out.end(), lib) == out.end())
            {
                VDFPATCH_LOG_DEBUG("steam", "library folder '" + lib.string() + "'");
                out.push_back(std::move(lib));
            }
            pos = q + 1 + len;
        }

        return out;
    }

} // namespace vdfpatch::steam

#endif // VDFPATCH_STEAM_HPP
