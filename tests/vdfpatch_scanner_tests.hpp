#ifndef VDFPATCH_TESTS_SCANNER__
#define VDFPATCH_TESTS_SCANNER__

#include "vdfpatch_test_harness.hpp"
#include "../include/vdfpatch_scanner.hpp"

namespace vdfpatch::tests
{

static bool scanner_finds_flat_block()
{
    constexpr std::string_view doc = "\"100\"{\"name\" \"Foo\"}";

    auto r = find_record_block(doc, 0);
    EXPECT(found(r), "block not found");
    EXPECT(span_of(r).view(doc) == "\"name\" \"Foo\"", "wrong interior");
    EXPECT(doc[span_of(r).start - 1] == '{', "span should start after the opening brace");
    EXPECT(doc[span_of(r).end] == '}', "span should end at the closing brace");

    return true;
}

static bool scanner_matches_nested_braces()
{
    constexpr std::string_view doc =
        "\"a\"\n{\n\t\"b\"\n\t{\n\t\t\"c\" \"1\"\n\t}\n\t\"d\" \"2\"\n}\n\"e\" { }";

    auto r = find_record_block(doc, 0);
    EXPECT(found(r), "outer block not found");

    auto inner = span_of(r).view(doc);
    EXPECT(inner.find("\"d\" \"2\"") != std::string_view::npos, "outer span cut short by inner block");
    EXPECT(inner.find("\"e\"") == std::string_view::npos, "outer span runs into next record");

    return true;
}

static bool scanner_starts_at_offset()
{
    constexpr std::string_view doc = "{ \"x\" \"1\" } { \"y\" \"2\" }";

    auto r = find_record_block(doc, 2);
    EXPECT(found(r), "second block not found");
    EXPECT(span_of(r).view(doc) == " \"y\" \"2\" ", "wrong block for offset");

    return true;
}

static bool scanner_reports_missing_block()
{
    constexpr std::string_view doc = "\"key\" \"value\"";

    auto r = find_record_block(doc, 0);
    EXPECT(!found(r), "no block should be found");
    EXPECT(failure_of(r).kind == lookup_failure_kind::no_block, "should be no_block");

    auto past_end = find_record_block(doc, doc.size() + 10);
    EXPECT(!found(past_end), "offset past end should not find anything");

    return true;
}

static bool scanner_reports_unbalanced_block()
{
    constexpr std::string_view doc = "\"a\" { \"b\" { \"c\" \"1\" }";

    auto r = find_record_block(doc, 0);
    EXPECT(!found(r), "unbalanced block should not be found");
    EXPECT(failure_of(r).kind == lookup_failure_kind::unbalanced, "should be unbalanced");
    EXPECT(failure_of(r).offset == doc.find('{'), "offset should point at the opening brace");

    return true;
}

static bool scanner_counts_braces_inside_values()
{
    // Braces in quoted values are structural to the scanner.
    constexpr std::string_view doc = "\"a\" { \"v\" \"}\" \"w\" \"1\" }";

    auto r = find_record_block(doc, 0);
    EXPECT(found(r), "block should be found");
    EXPECT(span_of(r).view(doc) == " \"v\" \"", "scanner should stop at the brace inside the value");

    return true;
}

static bool scanner_handles_empty_block()
{
    constexpr std::string_view doc = "\"a\"{}";

    auto r = find_record_block(doc, 0);
    EXPECT(found(r), "empty block not found");
    EXPECT(span_of(r).empty(), "empty block should have an empty span");

    return true;
}

//============================================================================
// Test Runner
//============================================================================

inline void run_scanner_tests()
{
    SUBCAT("Balanced blocks");
    RUN_TEST(scanner_finds_flat_block);
    RUN_TEST(scanner_matches_nested_braces);
    RUN_TEST(scanner_starts_at_offset);
    RUN_TEST(scanner_handles_empty_block);

    SUBCAT("Failures");
    RUN_TEST(scanner_reports_missing_block);
    RUN_TEST(scanner_reports_unbalanced_block);

    SUBCAT("Known simplifications");
    RUN_TEST(scanner_counts_braces_inside_values);
}

}

#endif
