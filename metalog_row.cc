// Copyright (C) 2008 The metalog developers
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "base.hh"
#include <sstream>

#include <boost/tokenizer.hpp>

#include "char_classifiers.hh"
#include "constants.hh"
#include "lexical_cast.hh"
#include "metalog_row.hh"
#include "sanity.hh"
#include "simplestring_xform.hh"

using std::make_pair;
using std::ostringstream;
using std::set;
using std::string;
using std::vector;

using boost::char_separator;
using boost::lexical_cast;
using boost::bad_lexical_cast;

bool
metalog_row::has_attr(attr_key const & key) const
{
  attr_value dummy;
  return get_attr(key, dummy);
}

bool
metalog_row::get_attr(attr_key const & key, attr_value & val) const
{
  for (vector<metalog_attr>::const_iterator i = attrs.begin();
       i != attrs.end(); ++i)
    if (i->first == key)
      {
        val = i->second;
        return true;
      }
  return false;
}

void
metalog_row::set_attr(attr_key const & key, attr_value const & val)
{
  for (vector<metalog_attr>::iterator i = attrs.begin();
       i != attrs.end(); ++i)
    if (i->first == key)
      {
        i->second = val;
        return;
      }
  attrs.push_back(make_pair(key, val));
}

template <> void
dump(metalog_row const & row, string & out)
{
  ostringstream oss;
  oss << row.filename << " (line " << row.lineno << ")";
  for (vector<metalog_attr>::const_iterator i = row.attrs.begin();
       i != row.attrs.end(); ++i)
    oss << ' ' << i->first << '=' << i->second;
  oss << '\n';
  out = oss.str();
}

bool
parse_metalog_row(string const & line, size_t lineno, metalog_row & row)
{
  // the name starts in the first column and runs up to the first
  // whitespace; everything after it is attributes.
  if (line.empty() || is_space(line[0]))
    return false;

  string::size_type name_end = 0;
  while (name_end < line.size() && !is_space(line[name_end]))
    ++name_end;
  if (name_end == line.size())
    return false;

  vector<string> tokens;
  split_into_words(line.substr(name_end), tokens);
  if (tokens.empty())
    return false;

  metalog_row tmp;
  tmp.filename = metalog_path(line.substr(0, name_end));
  tmp.lineno = lineno;

  for (vector<string>::const_iterator i = tokens.begin();
       i != tokens.end(); ++i)
    {
      string::size_type eq = i->find('=');
      if (eq == string::npos || eq == 0 || eq + 1 == i->size())
        {
          L(FL("line %d: ignoring attribute '%s'") % lineno % *i);
          continue;
        }
      tmp.set_attr(attr_key(i->substr(0, eq)),
                   attr_value(i->substr(eq + 1)));
    }

  row = tmp;
  return true;
}

bool
rows_all_equal(vector<metalog_row> const & rows, bool ignore_name,
               attr_key & offby)
{
  MM(rows);
  I(!rows.empty());

  metalog_row const & ref = idx(rows, 0);
  for (vector<metalog_row>::const_iterator r = rows.begin() + 1;
       r != rows.end(); ++r)
    {
      if (!ignore_name && r->filename != ref.filename)
        {
          offby = attr_key();
          return false;
        }
      for (vector<metalog_attr>::const_iterator a = r->attrs.begin();
           a != r->attrs.end(); ++a)
        {
          attr_value ref_val;
          if (ref.get_attr(a->first, ref_val) && ref_val != a->second)
            {
              L(FL("'%s' line %d and '%s' line %d differ in '%s'")
                % ref.filename % ref.lineno % r->filename % r->lineno
                % a->first);
              offby = a->first;
              return false;
            }
        }
    }
  return true;
}

void
get_row_packages(metalog_row const & row, set<package_name> & pkgs)
{
  attr_value tags;
  if (!row.get_attr(attr_key(constants::tags_attribute), tags))
    return;

  string const prefix(constants::package_tag_prefix);
  string::size_type pos = tags().find(prefix);
  if (pos == string::npos)
    return;

  // everything after the first "package=" names packages, even other
  // tags that happen to follow it in the list.
  string names = tags().substr(pos + prefix.size());
  typedef boost::tokenizer<char_separator<char> > tokenizer_t;
  char_separator<char> sep(",");
  tokenizer_t tokens(names, sep);
  for (tokenizer_t::const_iterator i = tokens.begin(); i != tokens.end(); ++i)
    pkgs.insert(package_name(*i));
}

bool
get_row_mode(metalog_row const & row, u32 & mode)
{
  attr_value val;
  if (!row.get_attr(attr_key(constants::mode_attribute), val))
    return false;

  string const & s = val();
  // ten octal digits always fit in 32 bits
  if (s.empty() || s.size() > 10)
    return false;

  u32 out = 0;
  for (string::const_iterator i = s.begin(); i != s.end(); ++i)
    {
      if (!is_odigit(*i))
        return false;
      out = (out << 3) | static_cast<u32>(*i - '0');
    }
  mode = out;
  return true;
}

bool
get_row_size(metalog_row const & row, u64 & size)
{
  attr_value val;
  if (!row.get_attr(attr_key(constants::size_attribute), val))
    return false;
  try
    {
      size = lexical_cast<u64>(val());
    }
  catch (bad_lexical_cast &)
    {
      return false;
    }
  return true;
}

bool
row_has_type(metalog_row const & row, char const * t)
{
  attr_value val;
  return row.get_attr(attr_key(constants::type_attribute), val)
    && val() == t;
}

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"

static metalog_row
row_from(string const & line, size_t lineno)
{
  metalog_row row;
  I(parse_metalog_row(line, lineno, row));
  return row;
}

UNIT_TEST(metalog_row, parse_basic)
{
  metalog_row row;
  UNIT_TEST_REQUIRE(parse_metalog_row("./bin/sh uname=root gname=wheel "
                                      "mode=0555 size=157888 type=file "
                                      "tags=package=runtime", 12, row));
  UNIT_TEST_CHECK(row.filename == metalog_path("./bin/sh"));
  UNIT_TEST_CHECK(row.lineno == 12);
  UNIT_TEST_REQUIRE(row.attrs.size() == 6);
  UNIT_TEST_CHECK(row.attrs[0].first == attr_key("uname"));
  UNIT_TEST_CHECK(row.attrs[5].first == attr_key("tags"));
  UNIT_TEST_CHECK(row.attrs[5].second == attr_value("package=runtime"));

  attr_value v;
  UNIT_TEST_CHECK(row.get_attr(attr_key("mode"), v));
  UNIT_TEST_CHECK(v == attr_value("0555"));
  UNIT_TEST_CHECK(!row.has_attr(attr_key("time")));
}

UNIT_TEST(metalog_row, parse_drops_bad_tokens)
{
  metalog_row row = row_from("./a junk =x y= type=file k=v=w\tsize=1", 3);
  UNIT_TEST_REQUIRE(row.attrs.size() == 3);
  UNIT_TEST_CHECK(row.attrs[0].first == attr_key("type"));
  UNIT_TEST_CHECK(row.attrs[1].first == attr_key("k"));
  UNIT_TEST_CHECK(row.attrs[1].second == attr_value("v=w"));
  UNIT_TEST_CHECK(row.attrs[2].first == attr_key("size"));
}

UNIT_TEST(metalog_row, parse_keeps_escapes)
{
  metalog_row row = row_from("./usr/share/a\\040b type=file", 1);
  UNIT_TEST_CHECK(row.filename() == "./usr/share/a\\040b");
}

UNIT_TEST(metalog_row, parse_repeated_key)
{
  metalog_row row = row_from("./a mode=0644 type=file mode=0600", 1);
  UNIT_TEST_REQUIRE(row.attrs.size() == 2);
  UNIT_TEST_CHECK(row.attrs[0].first == attr_key("mode"));
  UNIT_TEST_CHECK(row.attrs[0].second == attr_value("0600"));
}

UNIT_TEST(metalog_row, parse_malformed)
{
  metalog_row row;
  row.lineno = 99;
  UNIT_TEST_CHECK(!parse_metalog_row("", 1, row));
  UNIT_TEST_CHECK(!parse_metalog_row("./lonely", 1, row));
  UNIT_TEST_CHECK(!parse_metalog_row("./trailing   ", 1, row));
  UNIT_TEST_CHECK(!parse_metalog_row(" ./indented type=file", 1, row));
  UNIT_TEST_CHECK(row.lineno == 99);

  // a name with only unparseable tokens is still a row
  UNIT_TEST_CHECK(parse_metalog_row("./x junk", 4, row));
  UNIT_TEST_CHECK(row.attrs.empty());
  UNIT_TEST_CHECK(row.lineno == 4);
}

UNIT_TEST(metalog_row, all_equal_identical)
{
  vector<metalog_row> rows;
  rows.push_back(row_from("./etc/foo mode=0644 size=10 type=file", 1));
  rows.push_back(row_from("./etc/foo mode=0644 size=10 type=file", 2));
  attr_key offby;
  UNIT_TEST_CHECK(rows_all_equal(rows, false, offby));

  vector<metalog_row> one;
  one.push_back(rows[0]);
  UNIT_TEST_CHECK(rows_all_equal(one, false, offby));
}

UNIT_TEST(metalog_row, all_equal_first_conflicting_key)
{
  vector<metalog_row> rows;
  rows.push_back(row_from("./f uname=root mode=0644 size=10", 1));
  rows.push_back(row_from("./f size=11 uname=root mode=0640", 7));
  attr_key offby;
  UNIT_TEST_CHECK(!rows_all_equal(rows, false, offby));
  // the order is that of the row being compared, not of the reference
  UNIT_TEST_CHECK(offby == attr_key("size"));
}

UNIT_TEST(metalog_row, all_equal_is_one_directional)
{
  vector<metalog_row> rows;
  rows.push_back(row_from("./f mode=0644 tags=package=a", 1));
  rows.push_back(row_from("./f mode=0644 time=5", 2));
  attr_key offby;
  UNIT_TEST_CHECK(rows_all_equal(rows, false, offby));

  // later rows are only ever compared with the first one
  rows.push_back(row_from("./f time=6", 3));
  UNIT_TEST_CHECK(rows_all_equal(rows, false, offby));
}

UNIT_TEST(metalog_row, all_equal_names)
{
  vector<metalog_row> rows;
  rows.push_back(row_from("./a mode=0644 type=file", 1));
  rows.push_back(row_from("./b mode=0644 type=file", 2));
  attr_key offby(attr_key("stale"));
  UNIT_TEST_CHECK(!rows_all_equal(rows, false, offby));
  UNIT_TEST_CHECK(offby() == "");
  UNIT_TEST_CHECK(rows_all_equal(rows, true, offby));
}

UNIT_TEST(metalog_row, all_equal_empty_is_a_bug)
{
  vector<metalog_row> rows;
  attr_key offby;
  UNIT_TEST_CHECK_THROW(rows_all_equal(rows, false, offby), std::logic_error);
}

UNIT_TEST(metalog_row, packages)
{
  set<package_name> pkgs;
  get_row_packages(row_from("./a type=file", 1), pkgs);
  UNIT_TEST_CHECK(pkgs.empty());

  get_row_packages(row_from("./a tags=debug", 1), pkgs);
  UNIT_TEST_CHECK(pkgs.empty());

  get_row_packages(row_from("./a tags=package=clibs,debug", 1), pkgs);
  UNIT_TEST_REQUIRE(pkgs.size() == 2);
  UNIT_TEST_CHECK(pkgs.find(package_name("clibs")) != pkgs.end());
  UNIT_TEST_CHECK(pkgs.find(package_name("debug")) != pkgs.end());

  pkgs.clear();
  get_row_packages(row_from("./a tags=config,package=rc,,x,package=y", 1),
                   pkgs);
  UNIT_TEST_REQUIRE(pkgs.size() == 3);
  UNIT_TEST_CHECK(pkgs.find(package_name("rc")) != pkgs.end());
  UNIT_TEST_CHECK(pkgs.find(package_name("x")) != pkgs.end());
  UNIT_TEST_CHECK(pkgs.find(package_name("package=y")) != pkgs.end());

  pkgs.clear();
  get_row_packages(row_from("./a tags=package=", 1), pkgs);
  UNIT_TEST_CHECK(pkgs.empty());
}

UNIT_TEST(metalog_row, mode)
{
  u32 mode = 0;
  UNIT_TEST_CHECK(get_row_mode(row_from("./a mode=4755", 1), mode));
  UNIT_TEST_CHECK(mode == 04755);
  UNIT_TEST_CHECK((mode & constants::setuid_bit) != 0);
  UNIT_TEST_CHECK((mode & constants::setgid_bit) == 0);

  UNIT_TEST_CHECK(get_row_mode(row_from("./a mode=02755", 1), mode));
  UNIT_TEST_CHECK((mode & constants::setuid_bit) == 0);
  UNIT_TEST_CHECK((mode & constants::setgid_bit) != 0);

  UNIT_TEST_CHECK(get_row_mode(row_from("./a mode=0755", 1), mode));
  UNIT_TEST_CHECK(mode == 0755);

  mode = 1;
  UNIT_TEST_CHECK(!get_row_mode(row_from("./a type=file", 1), mode));
  UNIT_TEST_CHECK(!get_row_mode(row_from("./a mode=0789", 1), mode));
  UNIT_TEST_CHECK(!get_row_mode(row_from("./a mode=rwxr-xr-x", 1), mode));
  UNIT_TEST_CHECK(mode == 1);
}

UNIT_TEST(metalog_row, size_and_type)
{
  u64 size = 0;
  metalog_row row = row_from("./a type=file size=1166", 1);
  UNIT_TEST_CHECK(get_row_size(row, size));
  UNIT_TEST_CHECK(size == 1166);
  UNIT_TEST_CHECK(row_has_type(row, constants::file_type));
  UNIT_TEST_CHECK(!row_has_type(row, constants::dir_type));

  UNIT_TEST_CHECK(!get_row_size(row_from("./a type=file", 1), size));
  UNIT_TEST_CHECK(!get_row_size(row_from("./a size=1k", 1), size));
  UNIT_TEST_CHECK(!row_has_type(row_from("./a size=1", 1),
                                constants::file_type));
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
