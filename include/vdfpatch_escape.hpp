// vdfpatch_escape.hpp - vdfpatch - Quoted-string escape codec
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef VDFPATCH_ESCAPE_HPP
#define VDFPATCH_ESCAPE_HPP

#include "vdfpatch_core.hpp"

namespace vdfpatch
{
//========================================================================
// ESCAPE API
//========================================================================

    // Only '\\' and '"' are escaped. Backslashes go first so the escape
    // added in front of a quote is not escaped again.
    std::string encode(std::string_view raw);

    // Inverse of encode(). Any other backslash sequence is kept verbatim.
    std::string decode(std::string_view escaped);

    // Length of the quoted value starting just after an opening quote at
    // `from`, honouring \" and \\. npos() when the quote never closes.
    size_t quoted_length(std::string_view text, size_t from) noexcept;

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        inline void replace_all(std::string & s, std::string_view what, std::string_view with)
        {
            if (what.empty())
                return;

            size_t pos = 0;
            while ((pos = s.find(what, pos)) != std::string::npos)
            {
                s.replace(pos, what.size(), with);
                pos += with.size();
            }
        }
    }

//========================================================================
// Escape API implementation
//========================================================================

    inline std::string encode(std::string_view raw)
    {
        std::string out(raw);
        detail::replace_all(out, "\\", "\\\\");
        detail::replace_all(out, "\"", "\\\"");
        return out;
    }

    inline std::string decode(std::string_view escaped)
    {
        std::string out;
        out.reserve(escaped.size());

        for (size_t i = 0; i < escaped.size(); ++i)
        {
            char c = escaped[i];
            if (c == '\\' && i + 1 < escaped.size() &&
                (escaped[i + 1] == '\\' || escaped[i + 1] == '"'))
            {
                out += escaped[++i];
                continue;
            }
            out += c;
        }

        return out;
    }

    inline size_t quoted_length(std::string_view text, size_t from) noexcept
    {
        for (size_t i = from; i < text.size(); ++i)
        {
            if (text[i] == '\\')
            {
                ++i;
                continue;
            }
            if (text[i] == '"')
                return i - from;
        }
        return npos();
    }

} // namespace vdfpatch

#endif // VDFPATCH_ESCAPE_HPP
