#include "vdfpatch_test_harness.hpp"
#include "vdfpatch_log_tests.hpp"
#include "vdfpatch_scanner_tests.hpp"
#include "vdfpatch_locator_tests.hpp"
#include "vdfpatch_escape_tests.hpp"
#include "vdfpatch_patcher_tests.hpp"
#include "vdfpatch_commit_tests.hpp"
#include "vdfpatch_reload_tests.hpp"
#include "vdfpatch_steam_tests.hpp"
#include "vdfpatch_pipeline_tests.hpp"

#include <cstring>
#include <iostream>

namespace vdfpatch::tests
{
    std::vector<test_result> results;
    char const * last_error = "";
}

bool first = true;

void run_tests( std::string suite_name, void(*pf_tests)() )
{
    if (!first)
        std::cout << '\n';
    else first = false;

    std::cout << suite_name << '\n';
    std::cout << std::string(suite_name.length(), '=') << '\n';
    pf_tests();
}

int main()
{
    using namespace vdfpatch::tests;

    vdfpatch::log::set_level(vdfpatch::log::level::off);

    #ifdef VDFPATCH_TESTS_LOG__
        run_tests("Logging", run_log_tests);
    #endif

    #ifdef VDFPATCH_TESTS_SCANNER__
        run_tests("Brace scanner", run_scanner_tests);
    #endif

    #ifdef VDFPATCH_TESTS_LOCATOR__
        run_tests("Section locator", run_locator_tests);
    #endif

    #ifdef VDFPATCH_TESTS_ESCAPE__
        run_tests("Escape codec", run_escape_tests);
    #endif

    #ifdef VDFPATCH_TESTS_PATCHER__
        run_tests("Field patcher", run_patcher_tests);
    #endif

    #ifdef VDFPATCH_TESTS_COMMIT__
        run_tests("Commit writer", run_commit_tests);
    #endif

    #ifdef VDFPATCH_TESTS_RELOAD__
        run_tests("Reload signal", run_reload_tests);
    #endif

    #ifdef VDFPATCH_TESTS_STEAM__
        run_tests("Steam helpers", run_steam_tests);
    #endif

    #ifdef VDFPATCH_TESTS_PIPELINE__
        run_tests("Pipeline", run_pipeline_tests);
    #endif

    size_t failed = std::count_if(results.begin(), results.end(),
                                  [](test_result const & r) { return !r.passed; });

    std::cout << '\n' << results.size() - failed << " / " << results.size() << " tests passed\n";
    return failed == 0 ? 0 : 1;
}
