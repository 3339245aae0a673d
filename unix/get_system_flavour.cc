// copyright (C) 2004 graydon hoare <graydon@pobox.com>
// all rights reserved.
// licensed to the public under the terms of the GNU GPL (>= 2)
// see the file COPYING for details

#include "base.hh"
#include <sys/utsname.h>
#include <ostream> // for operator<<

#include "sanity.hh"
#include "platform.hh"

void get_system_flavour(std::string & ident)
{
  struct utsname n;
  // some systems return a positive value on success
  I(uname(&n) >= 0);
  ident = (FL("%s %s %s %s")
           % n.sysname
           % n.release
           % n.version
           % n.machine).str();
}

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"

UNIT_TEST(system_flavour, names_the_kernel)
{
  std::string ident;
  get_system_flavour(ident);
  UNIT_TEST_CHECK(!ident.empty());
  UNIT_TEST_CHECK(ident.find(' ') != std::string::npos);
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
