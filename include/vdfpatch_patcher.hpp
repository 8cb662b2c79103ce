// vdfpatch_patcher.hpp - vdfpatch - Field patcher
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef VDFPATCH_PATCHER_HPP
#define VDFPATCH_PATCHER_HPP

#include "vdfpatch_core.hpp"
#include "vdfpatch_escape.hpp"
#include "vdfpatch_log.hpp"

namespace vdfpatch
{
//========================================================================
// PATCHER API
//========================================================================

    struct field_format
    {
        // Fields after which a new field is placed. Scanned in this order;
        // the last one present wins.
        std::vector<std::string> anchors   { "name", "LastUpdated", "SizeOnDisk", "tool" };
        std::string              indent    { "\t\t\t\t\t\t" };
        std::string              separator { "\t\t" };
    };

    struct field_patch
    {
        std::string record;
        bool        was_insert {false};
    };

    // First "name" <ws> "value" pair in the record text. A second instance
    // of the same field is never looked at.
    std::optional<field> find_field(std::string_view record, std::string_view name);

    // Decoded value of the field, if present.
    std::optional<std::string> read_field(std::string_view record, std::string_view name);

    // Replaces the value of the first matching field, or inserts the field
    // when absent. `raw_value` is the unescaped logical value.
    field_patch patch_field(std::string_view record, std::string_view name,
                            std::string_view raw_value, field_format const & fmt = {});

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        inline std::string_view newline_of(std::string_view text)
        {
            return text.find("\r\n") != std::string_view::npos ? "\r\n" : "\n";
        }

        inline std::string field_line(std::string_view name, std::string_view escaped, field_format const & fmt)
        {
            std::string out = fmt.indent;
            out += quoted(name);
            out += fmt.separator;
            out += '"';
            out += escaped;
            out += '"';
            return out;
        }

        struct insertion
        {
            size_t      offset;
            std::string text;
        };

        inline insertion insertion_point(std::string_view record, std::string_view line, field_format const & fmt)
        {
            std::string_view nl = newline_of(record);

            std::optional<field> anchor;
            for (auto const & name : fmt.anchors)
            {
                if (auto f = find_field(record, name))
                    anchor = std::move(f);
            }

            if (anchor)
            {
                size_t line_end = record.find('\n', anchor->span->value_end);
                if (line_end != std::string_view::npos)
                    return { line_end + 1, std::string(line) + std::string(nl) };

                // anchor sits on the unterminated last line
                return { record.size(), std::string(nl) + std::string(line) };
            }

            // No anchor: go in front of the closing line when there is one,
            // so the brace keeps its indentation.
            size_t last_nl = record.rfind('\n');
            if (last_nl != std::string_view::npos &&
                record.find_first_not_of(" \t", last_nl + 1) == std::string_view::npos)
            {
                return { last_nl + 1, std::string(line) + std::string(nl) };
            }

            return { record.size(), std::string(nl) + std::string(line) };
        }
    }

//========================================================================
// Patcher API implementation
//========================================================================

    inline std::optional<field> find_field(std::string_view record, std::string_view name)
    {
        std::string needle = detail::quoted(name);
        size_t pos = 0;

        while ((pos = record.find(needle, pos)) != std::string_view::npos)
        {
            size_t after = pos + needle.size();
            size_t q     = record.find_first_not_of(detail::WHITESPACE, after);

            if (q != after && q != std::string_view::npos && record[q] == '"')
            {
                size_t len = quoted_length(record, q + 1);
                if (len != npos())
                {
                    field f;
                    f.name          = std::string(name);
                    f.escaped_value = std::string(record.substr(q + 1, len));
                    f.raw_value     = decode(f.escaped_value);
                    f.span          = field_span{ pos, q + 1, q + 1 + len };
                    return f;
                }
            }

            pos = after;
        }

        return std::nullopt;
    }

    inline std::optional<std::string> read_field(std::string_view record, std::string_view name)
    {
        if (auto f = find_field(record, name))
            return f->raw_value;
        return std::nullopt;
    }

    inline field_patch patch_field(std::string_view record, std::string_view name,
                                   std::string_view raw_value, field_format const & fmt)
    {
        std::string escaped = encode(raw_value);
        field_patch out;

        if (auto existing = find_field(record, name))
        {
            auto const & sp = *existing->span;

            out.record.reserve(record.size() + escaped.size());
            out.record.append(record.substr(0, sp.value_start));
            out.record.append(escaped);
            out.record.append(record.substr(sp.value_end));
            out.was_insert = false;

            VDFPATCH_LOG_DEBUG("patcher", "replaced \"" + std::string(name) + "\": '"
                + existing->raw_value + "' -> '" + std::string(raw_value) + "'");
            return out;
        }

        auto ins = detail::insertion_point(record, detail::field_line(name, escaped, fmt), fmt);

        out.record.reserve(record.size() + ins.text.size());
        out.record.append(record.substr(0, ins.offset));
        out.record.append(ins.text);
        out.record.append(record.substr(ins.offset));
        out.was_insert = true;

        VDFPATCH_LOG_DEBUG("patcher", "inserted \"" + std::string(name) + "\" at record offset "
            + std::to_string(ins.offset));
        return out;
    }

} // namespace vdfpatch

#endif // VDFPATCH_PATCHER_HPP
