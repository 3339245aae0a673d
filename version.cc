// Copyright (C) 2004 Nathaniel Smith <njs@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.


#include "base.hh"
#include <iostream>

#include <boost/version.hpp>
#include <boost/config.hpp>

#include "platform.hh"
#include "version.hh"
#include "sanity.hh"

using std::cout;
using std::string;

void
get_version(string & out)
{
  out = PACKAGE_STRING;
}

// the version line, then where and with what the binary was built
void
get_full_version(string & out)
{
  string flavour;
  get_system_flavour(flavour);
  get_version(out);
  out += '\n';
  out += (F("Running on          : %s\n"
            "C++ compiler        : %s\n"
            "C++ standard library: %s\n"
            "Boost version       : %s")
          % flavour % BOOST_COMPILER % BOOST_STDLIB % BOOST_LIB_VERSION).str();
}

void
print_version()
{
  string v;
  get_version(v);
  cout << v << '\n';
}

void
print_full_version()
{
  string v;
  get_full_version(v);
  cout << v << '\n';
}

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"

UNIT_TEST(version, full_version_starts_with_version)
{
  string v, full;
  get_version(v);
  get_full_version(full);
  UNIT_TEST_CHECK(v == PACKAGE_STRING);
  UNIT_TEST_CHECK(full.compare(0, v.size() + 1, v + "\n") == 0);
  UNIT_TEST_CHECK(full.find("Boost version       : ") != string::npos);
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
