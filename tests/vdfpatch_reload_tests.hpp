#ifndef VDFPATCH_TESTS_RELOAD__
#define VDFPATCH_TESTS_RELOAD__

#include "vdfpatch_test_harness.hpp"
#include "../include/vdfpatch_reload.hpp"

#include <csignal>
#include <sys/prctl.h>
#include <sys/wait.h>

namespace vdfpatch::tests
{
//------------------------------------------
// HELPERS
//------------------------------------------

    inline volatile std::sig_atomic_t hup_seen = 0;

    inline void on_hup(int) { hup_seen = 1; }

//------------------------------------------
// TESTS
//------------------------------------------

static bool reload_touch_updates_mtime()
{
    namespace fs = std::filesystem;
    temp_dir dir;
    auto target = dir.write("localconfig.vdf", "\"a\" { }");

    auto old_time = fs::file_time_type::clock::now() - std::chrono::hours(1);
    fs::last_write_time(target, old_time);

    reload_options opts;
    opts.send_signal = false;

    auto report = notify(target, "", opts);

    EXPECT(report.touched, "file should be touched");
    EXPECT(fs::last_write_time(target) > old_time, "mtime not updated");
    EXPECT(report.signalled.empty(), "nothing should be signalled");
    EXPECT(report.notes.empty(), "no notes expected");

    return true;
}

static bool reload_missing_file_is_a_note()
{
    temp_dir dir;

    reload_options opts;
    opts.send_signal = false;

    auto report = notify(dir.path / "absent.vdf", "", opts);

    EXPECT(!report.touched, "missing file cannot be touched");
    EXPECT(report.notes.size() == 1, "one note expected");

    return true;
}

static bool reload_unknown_process_is_a_note()
{
    temp_dir proc;

    reload_options opts;
    opts.touch     = false;
    opts.proc_root = proc.path;

    auto report = notify(proc.path / "unused", "steam", opts);

    EXPECT(report.signalled.empty(), "nothing should be signalled");
    EXPECT(!report.notes.empty(), "a note should explain the missing process");
    EXPECT(report.notes.back().find("no running 'steam'") != std::string::npos, "wrong note");

    return true;
}

static bool reload_finds_processes_by_name()
{
    temp_dir proc;
    proc.write("9999101/comm", "steam\n");
    proc.write("9999102/comm", "steamwebhelper\n");
    proc.write("9999102/cmdline", std::string("/home/u/.steam/ubuntu12_32/Steam\0-silent\0", 41));
    proc.write("9999103/comm", "bash\n");
    proc.write("9999103/cmdline", std::string("bash\0-c\0steam\0", 14));
    proc.write("self/comm", "steam\n");
    proc.write("9999104/cmdline", std::string("", 0));

    auto pids = find_processes("STEAM", proc.path);
    std::sort(pids.begin(), pids.end());

    EXPECT(pids == std::vector<int>({ 9999101, 9999102 }), "expected the two steam pids");
    EXPECT(find_processes("", proc.path).empty(), "empty name matches nothing");
    EXPECT(find_processes("steam", proc.path / "nope").empty(), "missing proc root yields nothing");

    return true;
}

static bool reload_signals_matching_process()
{
    // comm holds at most 15 characters
    constexpr char const * NAME = "vdfpatch_rl_t";

    int ready[2];
    EXPECT(::pipe(ready) == 0, "pipe failed");

    // SIGHUP stays blocked in the child until it waits for it.
    sigset_t block, old;
    sigemptyset(&block);
    sigaddset(&block, SIGHUP);
    ::sigprocmask(SIG_BLOCK, &block, &old);

    pid_t child = ::fork();
    if (child == 0)
    {
        struct sigaction sa {};
        sa.sa_handler = on_hup;
        sigemptyset(&sa.sa_mask);
        ::sigaction(SIGHUP, &sa, nullptr);
        ::prctl(PR_SET_NAME, NAME, 0, 0, 0);

        ::close(ready[0]);
        char c = 'r';
        if (::write(ready[1], &c, 1) != 1)
            ::_exit(2);

        sigset_t wait_mask = old;
        sigdelset(&wait_mask, SIGHUP);
        while (!hup_seen)
            ::sigsuspend(&wait_mask);
        ::_exit(0);
    }

    ::sigprocmask(SIG_SETMASK, &old, nullptr);
    ::close(ready[1]);

    char c = 0;
    ssize_t n = child > 0 ? ::read(ready[0], &c, 1) : -1;
    ::close(ready[0]);
    EXPECT(child > 0, "fork failed");

    reload_report report;
    if (n == 1)
    {
        reload_options opts;
        opts.touch = false;
        report = notify("", NAME, opts);
    }

    bool signalled = std::find(report.signalled.begin(), report.signalled.end(), static_cast<int>(child))
                   != report.signalled.end();
    if (!signalled)
        ::kill(child, SIGKILL);

    int status = 0;
    ::waitpid(child, &status, 0);

    EXPECT(n == 1, "child never became ready");
    EXPECT(signalled, "child pid missing from the signalled list");
    EXPECT(report.signalled.size() == 1, "only the child should be signalled");
    EXPECT(WIFEXITED(status) && WEXITSTATUS(status) == 0, "child did not receive SIGHUP");
    EXPECT(!report.aborted, "run should not abort");

    return true;
}

static bool reload_skips_entries_that_are_not_pids()
{
    temp_dir proc;
    proc.write("99999999999999999999/comm", "steam\n");
    proc.write("9999101/comm", "steam\n");

    EXPECT(find_processes("steam", proc.path) == std::vector<int>({ 9999101 }), "oversized entry should be skipped");

    static_assert(noexcept(notify(std::filesystem::path(), "steam", reload_options{})));

    // 9999101 is above any pid_max, so the kill fails and becomes a note.
    reload_options opts;
    opts.touch     = false;
    opts.proc_root = proc.path;
    auto report = notify("", "steam", opts);

    EXPECT(!report.aborted, "run should complete");
    EXPECT(report.signalled.empty(), "nothing should be signalled");
    EXPECT(std::any_of(report.notes.begin(), report.notes.end(), [](std::string const & note) {
               return note.find("could not signal pid 9999101") != std::string::npos;
           }), "failed kill should be noted");

    return true;
}

//============================================================================
// Test Runner
//============================================================================

inline void run_reload_tests()
{
    SUBCAT("Touch");
    RUN_TEST(reload_touch_updates_mtime);
    RUN_TEST(reload_missing_file_is_a_note);

    SUBCAT("Process lookup");
    RUN_TEST(reload_finds_processes_by_name);
    RUN_TEST(reload_unknown_process_is_a_note);
    RUN_TEST(reload_skips_entries_that_are_not_pids);

    SUBCAT("Signal delivery");
    RUN_TEST(reload_signals_matching_process);
}

}

#endif
