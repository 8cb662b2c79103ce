// vdfpatch.hpp - vdfpatch: surgical field patching for nested key/value documents
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

//========================================================================
// vdfpatch principles:
//========================================================================
//
// Bytes Outside The Field Are Not Ours
// ------------------------------------
// A patch touches one field of one record. Everything else in the
// document, including formatting the producer may consider sloppy,
// is written back exactly as it was read.
//
//
// Find, Then Scan
// ---------------
// Records are located by first textual occurrence of their quoted key
// and delimited by brace counting. There is no parse tree, so a
// document the engine cannot fully parse is still a document it can
// patch.
//
//
// Converge, Never Accumulate
// --------------------------
// Applying the same request twice yields the same text as applying it
// once.
//
//
// Swap Or Nothing
// ---------------
// The file on disk is either the old content or the new content. The
// only mutation is a rename of a fully written sibling file.
//
//========================================================================

#ifndef VDFPATCH_HPP
#define VDFPATCH_HPP

#include "vdfpatch_core.hpp"
#include "vdfpatch_log.hpp"
#include "vdfpatch_scanner.hpp"
#include "vdfpatch_locator.hpp"
#include "vdfpatch_escape.hpp"
#include "vdfpatch_patcher.hpp"
#include "vdfpatch_commit.hpp"
#include "vdfpatch_reload.hpp"

namespace vdfpatch
{
//========================================================================
// Pipeline configuration
//========================================================================

    struct patch_options
    {
        field_format   format;
        commit_options commit;
        reload_options reload;

        bool        skip_unchanged = true;    // no write, no backup when nothing changes
        bool        notify_owner   = true;
        std::string owner_hint;               // process to signal; empty: touch only
    };

//========================================================================
// In-memory patching
//========================================================================

    struct document_patch
    {
        std::string                text;
        bool                       was_insert {false};
        record_span                record;          // in the original text
        std::optional<std::string> previous_value;  // decoded, if the field existed
    };

    using patch_preview = std::variant<document_patch, error<patch_error_kind>>;

    inline bool is_error(patch_preview const & p) { return std::holds_alternative<error<patch_error_kind>>(p); }
    inline error<patch_error_kind> const & get_error(patch_preview const & p) { return std::get<error<patch_error_kind>>(p); }
    inline document_patch const & get_patch(patch_preview const & p) { return std::get<document_patch>(p); }

    // Locates the record and patches the field without touching the disk.
    patch_preview preview_patch(std::string_view text, patch_request const & req, field_format const & fmt = {});

    // Full pipeline: read, locate, patch, commit, verify, notify.
    patch_result apply_patch(std::filesystem::path const & path, patch_request const & req, patch_options const & opts = {});

//========================================================================
// Pipeline implementation
//========================================================================

    namespace detail
    {
        inline std::string describe_path(std::vector<std::string> const & path)
        {
            std::string out;
            for (auto const & key : path)
            {
                if (!out.empty())
                    out += " / ";
                out += detail::quoted(key);
            }
            return out;
        }
    }

    inline patch_preview preview_patch(std::string_view text, patch_request const & req, field_format const & fmt)
    {
        auto where = locate_record(text, std::span<const std::string>(req.record_path));

        if (!found(where))
        {
            auto const & fail = failure_of(where);
            std::string path = detail::describe_path(req.record_path);

            if (fail.kind == lookup_failure_kind::unbalanced)
                return error<patch_error_kind>{ patch_error_kind::malformed_document,
                    "unbalanced braces in block for " + path, fail.offset };

            return error<patch_error_kind>{ patch_error_kind::record_not_found,
                fail.kind == lookup_failure_kind::key_absent
                    ? "no record " + path
                    : "key for " + path + " does not open a record",
                fail.offset };
        }

        record_span span = span_of(where);
        std::string_view record = span.view(text);

        document_patch out;
        out.record         = span;
        out.previous_value = read_field(record, req.field_name);

        auto fp = patch_field(record, req.field_name, req.desired_value, fmt);
        out.was_insert = fp.was_insert;

        out.text.reserve(text.size() + fp.record.size() - record.size());
        out.text.append(text.substr(0, span.start));
        out.text.append(fp.record);
        out.text.append(text.substr(span.end));

        return out;
    }

    inline patch_result apply_patch(std::filesystem::path const & path, patch_request const & req, patch_options const & opts)
    {
        patch_result res;

        std::error_code ec;
        auto original = read_document(path, ec);
        if (!original)
        {
            std::string msg = "cannot read '" + path.string() + "': " + ec.message();
            VDFPATCH_LOG_ERROR("pipeline", msg);
            res.diagnostic = detail::make_error(patch_error_kind::read_failed, msg);
            return res;
        }

        auto preview = preview_patch(*original, req, opts.format);
        if (is_error(preview))
        {
            VDFPATCH_LOG_ERROR("pipeline", get_error(preview).message);
            res.diagnostic = get_error(preview);
            return res;
        }

        auto const & patched = get_patch(preview);
        res.was_insert = patched.was_insert;

        if (opts.skip_unchanged && patched.text == *original)
        {
            VDFPATCH_LOG_INFO("pipeline", "\"" + req.field_name + "\" already set in " + path.string());
            res.success      = true;
            res.status       = patch_status::unchanged;
            res.new_document = patched.text;
            return res;
        }

        verification check;
        check.expected.push_back(detail::quoted(req.record_path.back()));
        check.expected.push_back(encode(req.desired_value));

        patch_result committed = commit(path, patched.text, check, opts.commit);
        committed.was_insert = patched.was_insert;

        if (!committed.success)
            return committed;

        VDFPATCH_LOG_INFO("pipeline", std::string(patched.was_insert ? "inserted" : "replaced")
            + " \"" + req.field_name + "\" in " + detail::describe_path(req.record_path));

        if (opts.notify_owner)
        {
            auto report = notify(path, opts.owner_hint, opts.reload);
            committed.notes.insert(committed.notes.end(), report.notes.begin(), report.notes.end());
        }

        return committed;
    }

} // namespace vdfpatch

#endif // VDFPATCH_HPP
