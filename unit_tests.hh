#ifndef __UNIT_TESTS__
#define __UNIT_TESTS__

// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

// Logs the result; a failed check marks the test failed but lets it go on
#define UNIT_TEST_CHECK(expression)             \
  unit_test::do_check(expression, __FILE__, __LINE__, #expression)

// A failed require also ends the test
#define UNIT_TEST_REQUIRE(expression)           \
  unit_test::do_require(expression, __FILE__, __LINE__, #expression)

// "thrown" says whether statement is expected to throw exception
#define UNIT_TEST_THROW_CASE(statement, exception, thrown, text)        \
  do                                                                    \
    {                                                                   \
      bool unit_test_threw = false;                                     \
      try                                                               \
        {                                                               \
          statement;                                                    \
        }                                                               \
      catch(exception const &)                                          \
        {                                                               \
          unit_test_threw = true;                                       \
        }                                                               \
      unit_test::do_check(unit_test_threw == (thrown),                  \
                          __FILE__, __LINE__, text);                    \
    } while (0)

#define UNIT_TEST_CHECK_THROW(statement, exception)                     \
  UNIT_TEST_THROW_CASE(statement, exception, true,                      \
                       #statement " throws " #exception)

#define UNIT_TEST_CHECK_NOT_THROW(statement, exception)                 \
  UNIT_TEST_THROW_CASE(statement, exception, false,                     \
                       #statement " does not throw " #exception)

#define UNIT_TEST_CHECKPOINT(message)           \
  unit_test::do_checkpoint(__FILE__, __LINE__, message);


namespace unit_test {
  void do_check(bool checkval, char const * file,
                int line, char const * message);

  void do_require(bool checkval, char const * file,
                  int line, char const * message);

  void do_checkpoint(char const * file, int line, char const * message);

  // Declarative mechanism for specifying unit tests, similar to
  // auto_unit_test in boost, but more suited to our needs.  Every test
  // registers itself from a static constructor; the unit_tests program
  // runs exactly one of them per invocation, so a test may leave global
  // state (the symtabs, stdin) behind.
  struct unit_test_case
  {
    char const *group;
    char const *name;
    void (*func)();
    bool failure_is_success;
    unit_test_case(char const * group,
                   char const * name,
                   void (*func)(),
                   bool fis);
    unit_test_case();
  };
}

// The names of the test functions must not collide with each other or with
// names of symbols in the code being tested, despite their being in a
// separate namespace, so that references _from_ the test functions _to_ the
// code under test resolve correctly.
#define UNIT_TEST(GROUP, TEST)                    \
  namespace unit_test {                           \
      static void t_##GROUP##_##TEST();           \
      static unit_test_case r_##GROUP##_##TEST    \
      (#GROUP, #TEST, t_##GROUP##_##TEST, false); \
  }                                               \
  static void unit_test::t_##GROUP##_##TEST()

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif
