// vdfpatch_locator.hpp - vdfpatch - Section locator
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef VDFPATCH_LOCATOR_HPP
#define VDFPATCH_LOCATOR_HPP

#include "vdfpatch_scanner.hpp"
#include <span>

namespace vdfpatch
{
//========================================================================
// LOCATOR API
//========================================================================

    // First textual occurrence of "key" within `scope`, which must open a
    // block with nothing but whitespace in between. Later occurrences are
    // never considered, even when the first one does not open a block.
    block_lookup locate_record(std::string_view doc, std::string_view key);
    block_lookup locate_record(std::string_view doc, std::string_view key, record_span scope);

    // Walks the path one quoted key at a time, each search bounded to the
    // block found for the previous key.
    block_lookup locate_record(std::string_view doc, std::span<const std::string> path);

//========================================================================
// Locator API implementation
//========================================================================

    inline block_lookup locate_record(std::string_view doc, std::string_view key, record_span scope)
    {
        std::string needle = detail::quoted(key);
        std::string_view region = scope.view(doc);

        size_t hit = region.find(needle);
        if (hit == std::string_view::npos)
        {
            VDFPATCH_LOG_DEBUG("locator", "key " + needle + " not present");
            return lookup_failure{ lookup_failure_kind::key_absent, scope.start };
        }

        size_t after = scope.start + hit + needle.size();
        size_t brace = doc.find_first_not_of(detail::WHITESPACE, after);

        if (brace == std::string_view::npos || brace >= scope.end || doc[brace] != '{')
        {
            VDFPATCH_LOG_DEBUG("locator", "key " + needle + " at offset "
                + std::to_string(scope.start + hit) + " does not open a block");
            return lookup_failure{ lookup_failure_kind::no_block, scope.start + hit };
        }

        auto block = find_record_block(doc, brace);
        if (found(block) && span_of(block).end > scope.end)
            return lookup_failure{ lookup_failure_kind::unbalanced, brace };

        return block;
    }

    inline block_lookup locate_record(std::string_view doc, std::string_view key)
    {
        return locate_record(doc, key, record_span{ 0, doc.size() });
    }

    inline block_lookup locate_record(std::string_view doc, std::span<const std::string> path)
    {
        if (path.empty())
            return lookup_failure{ lookup_failure_kind::key_absent, 0 };

        block_lookup current = record_span{ 0, doc.size() };

        for (auto const & key : path)
        {
            current = locate_record(doc, key, span_of(current));
            if (!found(current))
                return current;
        }

        return current;
    }

} // namespace vdfpatch

#endif // VDFPATCH_LOCATOR_HPP
