// Copyright (C) 2007 Timothy Brownawell <tbrownaw@gmail.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.


#include "base.hh"
#include <limits>
#include "lexical_cast.hh"
#include "char_classifiers.hh"

template<>
u64 boost::lexical_cast<u64, std::string>(std::string const & s)
{
  u64 const max = std::numeric_limits<u64>::max();
  u64 out = 0;
  if (s.empty())
    throw boost::bad_lexical_cast();
  for (std::string::const_iterator i = s.begin(); i != s.end(); ++i)
    {
      if (!is_digit(*i))
        throw boost::bad_lexical_cast();
      u64 digit = *i - '0';
      if (out > (max - digit) / 10)
        throw boost::bad_lexical_cast();
      out = out*10 + digit;
    }
  return out;
}

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"

using boost::lexical_cast;
using boost::bad_lexical_cast;
using std::string;

UNIT_TEST(lexical_cast, u64_from_string)
{
  UNIT_TEST_CHECK(lexical_cast<u64>(string("0")) == 0);
  UNIT_TEST_CHECK(lexical_cast<u64>(string("1166")) == 1166);
  UNIT_TEST_CHECK(lexical_cast<u64>(string("18446744073709551615"))
                  == 18446744073709551615ULL);
}

UNIT_TEST(lexical_cast, u64_rejects_junk)
{
  UNIT_TEST_CHECK_THROW(lexical_cast<u64>(string("")), bad_lexical_cast);
  UNIT_TEST_CHECK_THROW(lexical_cast<u64>(string("-1")), bad_lexical_cast);
  UNIT_TEST_CHECK_THROW(lexical_cast<u64>(string(" 1")), bad_lexical_cast);
  UNIT_TEST_CHECK_THROW(lexical_cast<u64>(string("12k")), bad_lexical_cast);
  UNIT_TEST_CHECK_THROW(lexical_cast<u64>(string("18446744073709551616")),
                        bad_lexical_cast);
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
