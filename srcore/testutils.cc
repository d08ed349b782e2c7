// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "testutils.hh"
#include <algorithm>
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>
#include <glib.h>

#define TDEBUG(...)     SHEETROCK_KEY_DEBUG ("Test", __VA_ARGS__)

namespace Sheetrock {

/** The Test namespace holds the unit test harness.
 * Test programs register cases with REGISTER_TEST(), call init_core_test() and
 * then Test::run(). Contract violations are exercised in forked children, see trap_fork().
 */
namespace Test {

static bool test_verbose = false;

bool
verbose ()
{
  return test_verbose;
}

void
test_output (char kind, const String &message)
{
  static String pending_start;
  String out;
  switch (kind)
    {
    case 'S':                   // TSTART
      if (verbose())
        out = "# Test:  " + message + " ...\n";
      else
        pending_start = string_format ("  TEST   %-63s", message + ":");
      break;
    case 'D':                   // TDONE
      out = pending_start + (verbose() ? "# Done\n" : "OK\n");
      pending_start.clear();
      break;
    case 'I':                   // TINFO
      if (verbose())
        out = message + "\n";
      break;
    }
  printerr ("%s", out);
}

static std::function<void()> assertion_hook;

void
set_assertion_hook (const std::function<void()> &hook)
{
  assertion_hook = hook;
}

void
assertion_failed (const char *file, int line, const String &message)
{
  printerr ("%s:%d: assertion failed: %s\n", file ? file : program_alias().c_str(), line, message);
  if (assertion_hook)
    assertion_hook();
  abort();
}

struct TestEntry {
  String  name;
  void  (*func) ();
};

static vector<TestEntry>&
test_entries ()
{
  static vector<TestEntry> *entries = new vector<TestEntry>();   // filled by static ctors
  return *entries;
}

RegisterTest::RegisterTest (const String &testname, void (*test_func) ())
{
  test_entries().push_back (TestEntry { testname, test_func });
}

/// Run the registered tests ordered by name.
int
run ()
{
  vector<TestEntry> entries = test_entries();
  std::stable_sort (entries.begin(), entries.end(), [] (const TestEntry &a, const TestEntry &b) {
      return strverscmp (a.name.c_str(), b.name.c_str()) < 0;
    });
  TDEBUG ("running %zu tests", entries.size());
  for (const TestEntry &entry : entries)
    {
      TSTART ("%s", entry.name);
      entry.func();
      TDONE();
    }
  return 0;
}

// == Test Traps ==
enum TrapStatus {
  TRAP_EXITED   = 1 << 16,
  TRAP_SIGNALED = 1 << 17,
  TRAP_TIMEOUT  = 1 << 18,
};

static int    trap_pid = 0;
static int    trap_status = 0;
static String trap_out, trap_err;

static bool
drain_fd (int fd, String &buffer)
{
  char chunk[4096];
  ssize_t n;
  do
    n = read (fd, chunk, sizeof (chunk));
  while (n < 0 && errno == EINTR);
  if (n > 0)
    buffer.append (chunk, n);
  return n > 0;
}

/** Fork the test program to run code that is expected to fail.
 * Returns true in the child, which runs the code under test and then calls _exit().
 * The parent gets false once the child finished or was killed after @a usec_timeout,
 * the outcome can then be inspected with trap_aborted(), trap_passed(), trap_timed_out(),
 * trap_stdout() and trap_stderr().
 */
bool
trap_fork (uint64 usec_timeout, uint trap_flags)
{
  int out_pipe[2], err_pipe[2];
  if (pipe (out_pipe) < 0 || pipe (err_pipe) < 0)
    SHEETROCK_FATAL ("failed to create pipes for test trap: %s", strerror (errno));
  fflush (stdout);
  fflush (stderr);
  trap_status = 0;
  trap_out.clear();
  trap_err.clear();
  trap_pid = fork();
  if (trap_pid < 0)
    SHEETROCK_FATAL ("failed to fork test trap: %s", strerror (errno));
  if (trap_pid == 0)            // child
    {
      const int devnull = open ("/dev/null", O_RDONLY);
      if (devnull < 0 || dup2 (devnull, 0) < 0 || dup2 (out_pipe[1], 1) < 0 || dup2 (err_pipe[1], 2) < 0)
        SHEETROCK_FATAL ("failed to redirect test trap output: %s", strerror (errno));
      close (devnull);
      close (out_pipe[0]);
      close (out_pipe[1]);
      close (err_pipe[0]);
      close (err_pipe[1]);
      return true;
    }
  close (out_pipe[1]);
  close (err_pipe[1]);
  const uint64 deadline = timestamp_realtime() + usec_timeout;
  struct pollfd fds[2] = { { out_pipe[0], POLLIN, 0 }, { err_pipe[0], POLLIN, 0 } };
  bool timed_out = false;
  while (fds[0].fd >= 0 || fds[1].fd >= 0)
    {
      const uint64 now = timestamp_realtime();
      if (now >= deadline)
        {
          timed_out = true;
          break;
        }
      const int ret = poll (fds, 2, MIN (int ((deadline - now) / 1000) + 1, 100));
      if (ret < 0 && errno != EINTR)
        {
          SHEETROCK_CRITICAL ("failed to poll test trap output: %s", strerror (errno));
          break;
        }
      for (uint i = 0; i < 2 && ret > 0; i++)
        if (fds[i].fd >= 0 && fds[i].revents && !drain_fd (fds[i].fd, i == 0 ? trap_out : trap_err))
          {
            close (fds[i].fd);
            fds[i].fd = -1;     // poll() ignores negative descriptors
          }
    }
  for (uint i = 0; i < 2; i++)
    if (fds[i].fd >= 0)
      close (fds[i].fd);
  if (timed_out)
    kill (trap_pid, SIGKILL);
  int status = 0, wr;
  do
    wr = waitpid (trap_pid, &status, 0);
  while (wr < 0 && errno == EINTR);
  if (timed_out)
    trap_status = TRAP_TIMEOUT;
  else if (WIFEXITED (status))
    trap_status = TRAP_EXITED | WEXITSTATUS (status);
  else if (WIFSIGNALED (status))
    trap_status = TRAP_SIGNALED | WTERMSIG (status);
  if (!(trap_flags & TRAP_SILENCE_STDOUT))
    printout ("%s", trap_out);
  if (!(trap_flags & TRAP_SILENCE_STDERR))
    printerr ("%s", trap_err);
  TDEBUG ("trap %d finished with status 0x%x", trap_pid, trap_status);
  return false;
}

/// Fork with a generous timeout, the child's output is only captured.
bool
trap_fork_silent ()
{
  return trap_fork (30 * 1000000, TRAP_SILENCE_STDOUT | TRAP_SILENCE_STDERR);
}

bool
trap_timed_out ()
{
  SHEETROCK_ASSERT_RETURN (trap_pid != 0, false);
  return trap_status & TRAP_TIMEOUT;
}

/// Whether the trapped child exited with status 0.
bool
trap_passed ()
{
  SHEETROCK_ASSERT_RETURN (trap_pid != 0, false);
  return trap_status == (TRAP_EXITED | 0);
}

/// Whether the trapped child was terminated by SIGABRT.
bool
trap_aborted ()
{
  SHEETROCK_ASSERT_RETURN (trap_pid != 0, false);
  return trap_status == (TRAP_SIGNALED | SIGABRT);
}

String
trap_stdout ()
{
  SHEETROCK_ASSERT_RETURN (trap_pid != 0, "");
  return trap_out;
}

String
trap_stderr ()
{
  SHEETROCK_ASSERT_RETURN (trap_pid != 0, "");
  return trap_err;
}

} // Test

/** Initialize the Sheetrock core for a test program.
 * Like init_core(), with "fatal-warnings" enabled so every failing contract check aborts.
 * Verbose test output is enabled by --test-verbose or $SHEETROCK_TEST=test-verbose.
 */
void
init_core_test (const String &app_ident, int *argcp, char **argv, const StringVector &args)
{
  const char *testenv = g_getenv ("SHEETROCK_TEST");
  Test::test_verbose = arg_parse_option (argcp, argv, "--test-verbose") ||
                       (testenv && string_option_find (testenv, "test-verbose", NULL));
  StringVector targs = args;
  targs.push_back ("fatal-warnings=1");
  init_core (app_ident, argcp, argv, targs);
}

} // Sheetrock
