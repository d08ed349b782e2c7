// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __SHEETROCK_TESTUTILS_HH__
#define __SHEETROCK_TESTUTILS_HH__

#include <srcore/srcore.hh>
#include <type_traits>

namespace Sheetrock {

void init_core_test (const String &app_ident, int *argcp, char **argv, const StringVector &args = StringVector());

namespace Test {

// == Test Macros ==
#define TSTART(...)             Sheetrock::Test::test_output ('S', Sheetrock::string_format (__VA_ARGS__)) ///< Announce the start of a test case.
#define TDONE()                 Sheetrock::Test::test_output ('D', "")   ///< Announce the end of a test case.
#define TINFO(...)              Sheetrock::Test::test_output ('I', Sheetrock::string_format (__VA_ARGS__)) ///< Message shown with --test-verbose.
#define TASSERT(cond)           do { if (SHEETROCK_LIKELY (cond)) break; \
    Sheetrock::Test::assertion_failed (SHEETROCK_PRETTY_FILE, __LINE__, #cond); } while (0)
/// Check that (@a a @a cmp @a b) holds, failures print both values.
#define TCMP(a,cmp,b)           do { if (SHEETROCK_LIKELY ((a) cmp (b))) break;                   \
    Sheetrock::Test::assertion_failed (SHEETROCK_PRETTY_FILE, __LINE__,                             \
                                       Sheetrock::string_format ("'%s %s %s': %s %s %s", #a, #cmp, #b, \
                                                                 Sheetrock::Test::stringify_arg (a), #cmp, \
                                                                 Sheetrock::Test::stringify_arg (b))); } while (0)

// == Test Registry ==
int     run                ();  ///< Run all registered tests.
bool    verbose            ();  ///< Indicates whether tests should run verbosely.
void    set_assertion_hook (const std::function<void()> &hook);        ///< Install a hook to run when a TASSERT() fails.

/// @cond
void    test_output        (char kind, const String &message);
void    assertion_failed   (const char *file, int line, const String &message) SHEETROCK_NORETURN;
/// @endcond

// == Value Rendering ==
inline String stringify_arg (const char *a)     { return a ? string_format ("\"%s\"", a) : "(null)"; }
inline String stringify_arg (const String &a)   { return string_format ("\"%s\"", a); }
inline String stringify_arg (bool a)            { return a ? "true" : "false"; }
inline String stringify_arg (std::nullptr_t)    { return "(null)"; }
template<class A> inline typename std::enable_if<std::is_floating_point<A>::value, String>::type
stringify_arg (A a)                             { return string_format ("%.17g", double (a)); }
template<class A> inline typename std::enable_if<std::is_integral<A>::value && std::is_signed<A>::value, String>::type
stringify_arg (A a)                             { return string_format ("%lld", (long long) a); }
template<class A> inline typename std::enable_if<std::is_integral<A>::value && !std::is_signed<A>::value, String>::type
stringify_arg (A a)                             { return string_format ("%llu", (unsigned long long) a); }
template<class A> inline typename std::enable_if<std::is_enum<A>::value, String>::type
stringify_arg (A a)                             { return string_format ("%lld", (long long) a); }
template<class V> inline String
stringify_arg (const V *a)                      { return string_format ("%p", (const void*) a); }
template<class V> inline String
stringify_arg (const std::shared_ptr<V> &a)     { return string_format ("%p", (const void*) a.get()); }

class RegisterTest {
public:
  RegisterTest (const String &testname, void (*test_func) ());
};

/// Register a test function under @a name for execution by Test::run().
#define REGISTER_TEST(name, ...)     static const Sheetrock::Test::RegisterTest \
  SHEETROCK_CPP_PASTE2 (__Sheetrock_RegisterTest__line, __LINE__) (name, __VA_ARGS__)

// == Test Traps ==
enum TrapFlags {
  TRAP_SILENCE_STDOUT  = 1 << 0,
  TRAP_SILENCE_STDERR  = 1 << 1,
};

bool    trap_fork          (uint64 usec_timeout, uint trap_flags);
bool    trap_fork_silent   ();
bool    trap_timed_out     ();
bool    trap_passed        ();
bool    trap_aborted       ();
String  trap_stdout        ();
String  trap_stderr        ();

} // Test
} // Sheetrock

#endif // __SHEETROCK_TESTUTILS_HH__
