// vdfpatch_scanner.hpp - vdfpatch - Tokenless brace scanner
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef VDFPATCH_SCANNER_HPP
#define VDFPATCH_SCANNER_HPP

#include "vdfpatch_core.hpp"
#include "vdfpatch_log.hpp"

namespace vdfpatch
{
//========================================================================
// SCANNER API
//========================================================================

    // Finds the first '{' at or after `after` and returns the interior of
    // the block it opens, matched by depth counting. Braces inside quoted
    // values are counted like any other brace; the documents this engine
    // targets never carry them.
    block_lookup find_record_block(std::string_view doc, size_t after = 0);

    // Depth-counts from an opening brace at `open`. Returns the offset of
    // the matching '}', or npos() when the block never closes.
    size_t match_closing_brace(std::string_view doc, size_t open) noexcept;

//========================================================================
// Scanner API implementation
//========================================================================

    inline size_t match_closing_brace(std::string_view doc, size_t open) noexcept
    {
        size_t depth = 0;

        for (size_t i = open; i < doc.size(); ++i)
        {
            if (doc[i] == '{')
            {
                ++depth;
            }
            else if (doc[i] == '}' && depth > 0)
            {
                if (--depth == 0)
                    return i;
            }
        }

        return npos();
    }

    inline block_lookup find_record_block(std::string_view doc, size_t after)
    {
        if (after >= doc.size())
            return lookup_failure{ lookup_failure_kind::no_block, after };

        size_t open = doc.find('{', after);
        if (open == std::string_view::npos)
            return lookup_failure{ lookup_failure_kind::no_block, after };

        size_t close = match_closing_brace(doc, open);
        if (close == npos())
        {
            VDFPATCH_LOG_DEBUG("scanner", "block at offset " + std::to_string(open) + " never closes");
            return lookup_failure{ lookup_failure_kind::unbalanced, open };
        }

        return record_span{ open + 1, close };
    }

} // namespace vdfpatch

#endif // VDFPATCH_SCANNER_HPP
