// vdfpatch_core.hpp - vdfpatch - Core Data Structures
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef VDFPATCH_CORE_HPP
#define VDFPATCH_CORE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <optional>
#include <filesystem>
#include <algorithm>
#include <compare>
#include <cctype>

namespace vdfpatch
{
//========================================================================
// Offsets
//========================================================================

    inline constexpr size_t npos() { return static_cast<size_t>(-1); }

//========================================================================
// Spans and fields
//========================================================================

    // Interior of one brace-delimited block, exclusive of the braces.
    // Offsets index the document snapshot the span was computed from and
    // are never valid across writes.
    struct record_span
    {
        size_t start {0};
        size_t end   {0};

        size_t size() const noexcept { return end - start; }
        bool   empty() const noexcept { return end == start; }

        std::string_view view(std::string_view doc) const
        {
            return doc.substr(start, end - start);
        }

        auto operator<=>(record_span const &) const = default;
    };

    enum class lookup_failure_kind
    {
        key_absent,   // quoted key never occurs in scope
        no_block,     // key occurs but does not open a block
        unbalanced    // a block opens but never closes
    };

    struct lookup_failure
    {
        lookup_failure_kind kind;
        size_t              offset {npos()};
    };

    using block_lookup = std::variant<record_span, lookup_failure>;

    inline bool found(block_lookup const & l) { return std::holds_alternative<record_span>(l); }
    inline record_span const & span_of(block_lookup const & l) { return std::get<record_span>(l); }
    inline lookup_failure const & failure_of(block_lookup const & l) { return std::get<lookup_failure>(l); }

    // Byte positions of a located field, relative to the record text it
    // was found in.
    struct field_span
    {
        size_t key_start   {0};   // opening quote of the key
        size_t value_start {0};   // first byte inside the value quotes
        size_t value_end   {0};   // closing quote of the value
    };

    struct field
    {
        std::string               name;
        std::string               raw_value;
        std::string               escaped_value;
        std::optional<field_span> span;  // nullopt: not yet in the record
    };

//========================================================================
// Requests and results
//========================================================================

    struct patch_request
    {
        std::vector<std::string> record_path;
        std::string              field_name;
        std::string              desired_value;   // unescaped
    };

    enum class patch_error_kind
    {
        read_failed,
        record_not_found,
        malformed_document,
        backup_failed,
        write_failed,
        verification_failed
    };

    template <typename Kind>
    struct error
    {
        Kind        kind;
        std::string message;
        size_t      offset {npos()};
    };

    enum class patch_status
    {
        applied,
        unchanged,
        written_unverified,
        failed
    };

    struct patch_result
    {
        bool                                   success {false};
        patch_status                           status {patch_status::failed};
        bool                                   was_insert {false};
        std::optional<std::string>             new_document;
        std::optional<std::filesystem::path>   backup_path;
        std::optional<error<patch_error_kind>> diagnostic;
        std::vector<error<patch_error_kind>>   warnings;
        std::vector<std::string>               notes;

        bool has_warnings() const { return !warnings.empty(); }
    };

//========================================================================
// UTILITY FUNCTIONS
//========================================================================

    namespace detail
    {
        constexpr std::string_view WHITESPACE = " \t\r\n";

        inline bool is_space(char c)
        {
            return c == ' ' || c == '\t' || c == '\r' || c == '\n';
        }

        inline std::string quoted(std::string_view key)
        {
            std::string out;
            out.reserve(key.size() + 2);
            out += '"';
            out += key;
            out += '"';
            return out;
        }

        inline std::string to_lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c){ return static_cast<char>(::tolower(c)); });
            return s;
        }

        inline std::string_view to_string(patch_error_kind kind)
        {
            switch (kind)
            {
                case patch_error_kind::read_failed:         return "read_failed";
                case patch_error_kind::record_not_found:    return "record_not_found";
                case patch_error_kind::malformed_document:  return "malformed_document";
                case patch_error_kind::backup_failed:       return "backup_failed";
                case patch_error_kind::write_failed:        return "write_failed";
                case patch_error_kind::verification_failed: return "verification_failed";
            }
            return "unknown";
        }

        inline std::string_view to_string(patch_status status)
        {
            switch (status)
            {
                case patch_status::applied:            return "applied";
                case patch_status::unchanged:          return "unchanged";
                case patch_status::written_unverified: return "written_unverified";
                case patch_status::failed:             return "failed";
            }
            return "unknown";
        }
    }

} // namespace vdfpatch

#endif // VDFPATCH_CORE_HPP
