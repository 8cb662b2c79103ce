// vdfpatch_log.hpp - vdfpatch - Tagged logging
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef VDFPATCH_LOG_HPP
#define VDFPATCH_LOG_HPP

#include <string>
#include <string_view>
#include <chrono>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <filesystem>

namespace vdfpatch::log
{
//========================================================================
// LOG API
//========================================================================

    enum class level
    {
        trace,
        debug,
        info,
        warn,
        error,
        off
    };

    // A sink replaces stderr output; the log file, if open, still receives
    // every line.
    using sink = std::function<void(level, std::string_view tag, std::string_view msg)>;

    void set_level(level lvl);
    level get_level();
    void set_sink(sink s);
    bool open_file(std::filesystem::path const & path);
    void close_file();

    // True when a message at `lvl` would be emitted.
    bool enabled(level lvl);

    // The sink and stderr are written outside the logger's lock.
    void write(level lvl, std::string_view tag, std::string_view msg);

    std::string_view to_string(level lvl);

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        struct state
        {
            std::mutex    mutex;
            level         threshold {level::warn};
            sink          user_sink;
            std::ofstream file;
        };

        inline state & global()
        {
            static state s;
            return s;
        }

        inline std::string timestamp()
        {
            auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm tm{};
            localtime_r(&t, &tm);
            std::ostringstream oss;
            oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
            return oss.str();
        }
    }

//========================================================================
// Log API implementation
//========================================================================

    inline std::string_view to_string(level lvl)
    {
        switch (lvl)
        {
            case level::trace: return "TRACE";
            case level::debug: return "DEBUG";
            case level::info:  return "INFO";
            case level::warn:  return "WARN";
            case level::error: return "ERROR";
            case level::off:   return "OFF";
        }
        return "?";
    }

    inline void set_level(level lvl)
    {
        auto & s = detail::global();
        std::lock_guard<std::mutex> lock(s.mutex);
        s.threshold = lvl;
    }

    inline level get_level()
    {
        auto & s = detail::global();
        std::lock_guard<std::mutex> lock(s.mutex);
        return s.threshold;
    }

    inline void set_sink(sink snk)
    {
        auto & s = detail::global();
        std::lock_guard<std::mutex> lock(s.mutex);
        s.user_sink = std::move(snk);
    }

    inline bool open_file(std::filesystem::path const & path)
    {
        auto & s = detail::global();
        std::lock_guard<std::mutex> lock(s.mutex);
        if (s.file.is_open())
            s.file.close();
        s.file.open(path, std::ios::out | std::ios::app);
        if (s.file.is_open())
            s.file << "==== vdfpatch log started " << detail::timestamp() << " ====" << std::endl;
        return s.file.is_open();
    }

    inline void close_file()
    {
        auto & s = detail::global();
        std::lock_guard<std::mutex> lock(s.mutex);
        if (s.file.is_open())
            s.file.close();
    }

    inline bool enabled(level lvl)
    {
        return lvl != level::off && lvl >= get_level();
    }

    inline void write(level lvl, std::string_view tag, std::string_view msg)
    {
        auto & s = detail::global();
        sink   forward;
        std::string text;

        {
            std::lock_guard<std::mutex> lock(s.mutex);

            if (lvl == level::off || lvl < s.threshold)
                return;

            std::ostringstream line;
            line << "[" << detail::timestamp() << "][" << to_string(lvl) << "][" << tag << "] " << msg;
            text = line.str();

            if (s.file.is_open())
            {
                s.file << text << std::endl;
                s.file.flush();
            }

            forward = s.user_sink;
        }

        // Sinks may log or change the level themselves.
        if (forward)
            forward(lvl, tag, msg);
        else
            std::cerr << text << std::endl;
    }

} // namespace vdfpatch::log

//========================================================================
// Macros for convenience
//========================================================================

#define VDFPATCH_LOG_AT(lvl, tag, msg)                                  \
    do                                                                  \
    {                                                                   \
        if (::vdfpatch::log::enabled(lvl))                              \
            ::vdfpatch::log::write(lvl, tag, msg);                      \
    } while (0)

#define VDFPATCH_LOG_TRACE(tag, msg) VDFPATCH_LOG_AT(::vdfpatch::log::level::trace, tag, msg)
#define VDFPATCH_LOG_DEBUG(tag, msg) VDFPATCH_LOG_AT(::vdfpatch::log::level::debug, tag, msg)
#define VDFPATCH_LOG_INFO(tag, msg)  VDFPATCH_LOG_AT(::vdfpatch::log::level::info,  tag, msg)
#define VDFPATCH_LOG_WARN(tag, msg)  VDFPATCH_LOG_AT(::vdfpatch::log::level::warn,  tag, msg)
#define VDFPATCH_LOG_ERROR(tag, msg) VDFPATCH_LOG_AT(::vdfpatch::log::level::error, tag, msg)

#endif // VDFPATCH_LOG_HPP
