// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "base.hh"
#include <map>
#include "vector.hh"
#include <iostream>

#include "option.hh"
#include "unit_tests.hh"
#include "sanity.hh"
#include "ui.hh"
#include "current_exception.hh"

using std::map;
using std::string;
using std::cout;
using std::cerr;
using std::clog;

typedef unit_test::unit_test_case test_t;
typedef map<string const, test_t> test_list_t;
typedef map<string const, test_list_t> group_list_t;

// This is used by other global constructors, so initialize on demand.
static group_list_t & unit_tests()
{
  static group_list_t tests;
  return tests;
}

unit_test::unit_test_case::unit_test_case(char const * group,
                                          char const * name,
                                          void (*func)(),
                                          bool fis)
  : group(group), name(name), func(func), failure_is_success(fis)
{
  unit_tests()[group][name] = *this;
}

unit_test::unit_test_case::unit_test_case()
{}

// Test state.
static bool this_test_failed = false;

namespace { struct require_failed {}; }

// CHECK and REQUIRE results go to the log, which is on stderr while a
// test runs
static void
note_result(bool ok, char const * kind, char const * file, int line,
            char const * message)
{
  if (!ok)
    this_test_failed = true;
  L(FL("%s:%d: %s %s: %s")
    % file % line % kind % (ok ? "OK" : "FAILED") % message);
}

void
unit_test::do_check(bool checkval, char const * file,
                    int line, char const * message)
{
  note_result(checkval, "CHECK", file, line, message);
}

void
unit_test::do_require(bool checkval, char const * file,
                      int line, char const * message)
{
  note_result(checkval, "REQUIRE", file, line, message);
  if (!checkval)
    throw require_failed();
}

void
unit_test::do_checkpoint(char const * file, int line,
                         char const * message)
{
  L(FL("%s:%d: CHECKPOINT: %s") % file % line % message);
}

static void
list_tests()
{
  for (group_list_t::const_iterator i = unit_tests().begin();
       i != unit_tests().end(); i++)
    for (test_list_t::const_iterator j = i->second.begin();
         j != i->second.end(); ++j)
      cout << i->first << ":" << j->first << "\n";
}

// "group:name" to its test case; false, with a reason, if there is none
static bool
find_test(string const & test_name, test_t & out, string & why)
{
  string::size_type sep = test_name.find(':');
  if (sep == string::npos)
    {
      why = "must specify a test, not a group, to run";
      return false;
    }

  string group = test_name.substr(0, sep);
  string test = test_name.substr(sep + 1);

  group_list_t::const_iterator g = unit_tests().find(group);
  if (g == unit_tests().end())
    {
      why = "unrecognized test group: " + group;
      return false;
    }
  test_list_t::const_iterator t = g->second.find(test);
  if (t == g->second.end())
    {
      why = "unrecognized test: " + test_name;
      return false;
    }
  out = t->second;
  return true;
}

static int
run_test(test_t const & t)
{
  L(FL("Beginning test %s:%s") % t.group % t.name);

  try
    {
      t.func();
    }
  catch(require_failed &)
    {
      // already logged by do_require
    }
  catch(std::exception const & e)
    {
      L(FL("UNCAUGHT EXCEPTION: %s") % describe_exception(e));
      this_test_failed = true;
    }
  catch(...)
    {
      L(FL("UNCAUGHT EXCEPTION: %s") % describe_current_exception());
      this_test_failed = true;
    }

  bool passed = !this_test_failed || t.failure_is_success;
  L(FL("Test %s:%s %s.\n") % t.group % t.name
    % (passed ? "succeeded" : "failed"));
  return passed ? 0 : 1;
}

int main(int argc, char * argv[])
{
  bool help(false);
  string test_to_run;

  ui.initialize();
  ui.prog_name = argv[0];
  global_sanity.initialize(argc, argv, "C");  // we didn't call setlocale

  try
    {
      option::concrete_option_set os;
      os("help,h", "display help message", option::setter(help))
        ("--", "", option::setter(test_to_run));

      os.from_command_line(argc, argv);
    }
  catch (option::option_error const & e)
    {
      cerr << ui.output_prefix() << e.what() << '\n';
      return 2;
    }

  if (help)
    {
      cout << (FL("Usage: %s [-h|--help] [GROUP:TEST]\n"
                  "  With no arguments, lists all test cases.\n"
                  "  With the name of a test case, runs that test.\n"
                  "  -h or --help prints this message.\n") % argv[0]);
      return 0;
    }

  if (test_to_run.empty())
    {
      list_tests();
      return 0;
    }

  test_t t;
  string why;
  if (!find_test(test_to_run, t, why))
    {
      cerr << ui.output_prefix() << why << '\n';
      return 2;
    }

  // Make clog and cout use the same streambuf as cerr; this ensures
  // that all messages will appear in the order written, no matter what
  // stream each one is written to.
  clog.rdbuf(cerr.rdbuf());
  cout.rdbuf(cerr.rdbuf());

  global_sanity.set_debug();
  return run_test(t);
}

// Stub for i18n.h's sake; the tests run in the "C" locale.
void
localize_metalog()
{
}

// These are tests of the unit testing mechanism itself.  They would all
// fail, but we make use of a special mechanism to convert that failure
// into a success.  Since we don't want that mechanism used elsewhere,
// the necessary definition macro is defined here and not in unit_test.hh.

#define NEGATIVE_UNIT_TEST(GROUP, TEST)           \
  namespace unit_test {                           \
      static void t_##GROUP##_##TEST();           \
      static unit_test_case r_##GROUP##_##TEST    \
      (#GROUP, #TEST, t_##GROUP##_##TEST, true);  \
  }                                               \
  static void unit_test::t_##GROUP##_##TEST()

#include <stdexcept>

NEGATIVE_UNIT_TEST(_unit_tester, fail_check)
{
  UNIT_TEST_CHECKPOINT("checkpoint");
  UNIT_TEST_CHECK(false);
  UNIT_TEST_CHECK(false);
}

NEGATIVE_UNIT_TEST(_unit_tester, fail_require)
{
  UNIT_TEST_CHECKPOINT("checkpoint");
  UNIT_TEST_REQUIRE(false);
  UNIT_TEST_CHECK(false);
}

NEGATIVE_UNIT_TEST(_unit_tester, fail_throw)
{
  UNIT_TEST_CHECK_THROW(string().size(), int);
}

NEGATIVE_UNIT_TEST(_unit_tester, fail_nothrow)
{
  UNIT_TEST_CHECK_NOT_THROW(throw int(), int);
}

NEGATIVE_UNIT_TEST(_unit_tester, uncaught)
{
  throw int();
}

NEGATIVE_UNIT_TEST(_unit_tester, uncaught_std)
{
  throw std::bad_exception();
}

NEGATIVE_UNIT_TEST(_unit_tester, uncaught_std_what)
{
  throw std::runtime_error("There is no spoon.");
}

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
