// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.


#include "base.hh"
#include <boost/unordered_map.hpp>

#include "sanity.hh"
#include "vocab.hh"
#include "char_classifiers.hh"

using std::string;

// verifiers for various types of data

// Every ATOMIC type not defined with the _NOVERIFY variant in
// vocab_terms.hh must have a verify function defined here.

static bool
has_space(string const & s)
{
  for (string::const_iterator i = s.begin(); i != s.end(); ++i)
    if (is_space(*i))
      return true;
  return false;
}

inline void
verify(metalog_path const & val)
{
  N(!val().empty(), F("empty METALOG entry name"));
  N(!has_space(val()),
    F("METALOG entry name '%s' contains whitespace") % val);
}

inline void
verify(attr_key const & val)
{
  N(!val().empty(), F("empty attribute key"));
  N(val().find('=') == string::npos,
    F("attribute key '%s' contains '='") % val);
  N(!has_space(val()),
    F("attribute key '%s' contains whitespace") % val);
}

inline void
verify(attr_value const & val)
{
  N(!val().empty(), F("empty attribute value"));
  N(!has_space(val()),
    F("attribute value '%s' contains whitespace") % val);
}

inline void
verify(package_name const & val)
{
  N(!val().empty(), F("empty package name"));
  N(val().find(',') == string::npos,
    F("package name '%s' contains ','") % val);
  N(!has_space(val()),
    F("package name '%s' contains whitespace") % val);
}


// ATOMIC types each keep a static symbol table and a counter of
// activations.  While a symtab object is alive, equal values of that type
// share a single immutable_string, so a METALOG with thousands of
// "uname=root" attributes keeps one copy of each.
struct
symtab_impl
{
  typedef boost::unordered_map<string, immutable_string> hmap;
  hmap vals;
  symtab_impl() : vals() {}
  void clear() { vals.clear(); }
  immutable_string const & unique(string const & in)
  {
    hmap::const_iterator i = vals.find(in);
    if (i != vals.end())
      return i->second;
    return vals.insert(std::make_pair(in, immutable_string(in))).first->second;
  }
};

// instantiation of various vocab functions


#include "vocab_macros.hh"
#define ATOMIC(ty) cc_ATOMIC(ty)
#define ATOMIC_HOOKED(ty,hook) cc_ATOMIC(ty)
#define ATOMIC_NOVERIFY(ty) cc_ATOMIC_NOVERIFY(ty)

#include "vocab_terms.hh"

#undef ATOMIC
#undef ATOMIC_HOOKED
#undef ATOMIC_NOVERIFY

#ifdef BUILD_UNIT_TESTS

#include "unit_tests.hh"

UNIT_TEST(vocab, verify_metalog_path)
{
  UNIT_TEST_CHECK(metalog_path("./usr/bin/env")() == "./usr/bin/env");
  UNIT_TEST_CHECK_THROW(metalog_path(""), informative_failure);
  UNIT_TEST_CHECK_THROW(metalog_path("./a b"), informative_failure);
  UNIT_TEST_CHECK_THROW(metalog_path("./a\tb"), informative_failure);
}

UNIT_TEST(vocab, verify_attr_key_and_value)
{
  UNIT_TEST_CHECK(attr_key("mode")() == "mode");
  UNIT_TEST_CHECK_THROW(attr_key(""), informative_failure);
  UNIT_TEST_CHECK_THROW(attr_key("mo=de"), informative_failure);

  // values may carry further '=' signs
  UNIT_TEST_CHECK(attr_value("package=a,b")() == "package=a,b");
  UNIT_TEST_CHECK_THROW(attr_value(""), informative_failure);
  UNIT_TEST_CHECK_THROW(attr_value("a b"), informative_failure);
}

UNIT_TEST(vocab, verify_package_name)
{
  UNIT_TEST_CHECK(package_name("runtime")() == "runtime");
  UNIT_TEST_CHECK_THROW(package_name(""), informative_failure);
  UNIT_TEST_CHECK_THROW(package_name("a,b"), informative_failure);
}

UNIT_TEST(vocab, symtab_shares_storage)
{
  attr_value::symtab active;
  attr_value a("root");
  attr_value b(std::string("ro") + "ot");
  UNIT_TEST_CHECK(a == b);
  UNIT_TEST_CHECK(&a() == &b());

  attr_value c("wheel");
  UNIT_TEST_CHECK(a != c);
  UNIT_TEST_CHECK(a < c);
}

UNIT_TEST(vocab, default_constructed_is_empty)
{
  metalog_path p;
  UNIT_TEST_CHECK(p().empty());
  UNIT_TEST_CHECK(p == metalog_path());
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
