// Copyright (C) 2008 The metalog developers
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "base.hh"

#include "char_classifiers.hh"
#include "metalog_index.hh"
#include "sanity.hh"
#include "simplestring_xform.hh"

using std::set;
using std::string;
using std::vector;

size_t
metalog_index::row_count() const
{
  size_t n = 0;
  for (file_map::const_iterator i = files.begin(); i != files.end(); ++i)
    n += i->second.size();
  return n;
}

static bool
skipped_line(string const & line)
{
  string::const_iterator i = line.begin();
  while (i != line.end() && is_space(*i))
    ++i;
  return i == line.end() || *i == '#';
}

void
read_metalog(data const & dat, string const & source,
             metalog_index & index)
{
  // the same few owners, modes and tags repeat on every line
  metalog_path::symtab path_syms;
  attr_key::symtab key_syms;
  attr_value::symtab value_syms;
  package_name::symtab package_syms;

  metalog_index tmp;
  vector<string> lines;
  split_into_lines(dat(), lines);

  for (size_t i = 0; i < lines.size(); ++i)
    {
      string const & line = idx(lines, i);
      size_t lineno = i + 1;
      if (skipped_line(line))
        continue;

      metalog_row row;
      E(parse_metalog_row(line, lineno, row),
        F("%s:%d: malformed METALOG line '%s'") % source % lineno % line);

      tmp.files[row.filename].push_back(row);

      set<package_name> pkgs;
      get_row_packages(row, pkgs);
      for (set<package_name>::const_iterator p = pkgs.begin();
           p != pkgs.end(); ++p)
        tmp.packages[*p].insert(row.filename);
    }

  L(FL("%s: %d lines, %d entries, %d distinct names, %d packages")
    % source % lines.size() % tmp.row_count() % tmp.files.size()
    % tmp.packages.size());

  index.files.swap(tmp.files);
  index.packages.swap(tmp.packages);
}

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"

UNIT_TEST(metalog_index, groups_by_name_and_package)
{
  metalog_index index;
  read_metalog(data("#mtree v2.0\n"
                    "./bin type=dir mode=0755\n"
                    "\n"
                    "./bin/x mode=0755 type=file size=100 tags=package=core\n"
                    "   # indented comment\n"
                    "./bin/y mode=0755 type=file size=50 "
                    "tags=package=core,dev\n"
                    "./bin/x mode=0755 type=file size=100\n"),
               "METALOG", index);

  UNIT_TEST_CHECK(index.row_count() == 4);
  UNIT_TEST_REQUIRE(index.files.size() == 3);

  file_map::const_iterator x = index.files.find(metalog_path("./bin/x"));
  UNIT_TEST_REQUIRE(x != index.files.end());
  UNIT_TEST_REQUIRE(x->second.size() == 2);
  // physical line numbers, comments and blank lines included
  UNIT_TEST_CHECK(x->second[0].lineno == 4);
  UNIT_TEST_CHECK(x->second[1].lineno == 7);

  UNIT_TEST_REQUIRE(index.packages.size() == 2);
  package_map::const_iterator core = index.packages.find(package_name("core"));
  UNIT_TEST_REQUIRE(core != index.packages.end());
  UNIT_TEST_CHECK(core->second.size() == 2);
  package_map::const_iterator dev = index.packages.find(package_name("dev"));
  UNIT_TEST_REQUIRE(dev != index.packages.end());
  UNIT_TEST_CHECK(dev->second.size() == 1);
  UNIT_TEST_CHECK(*dev->second.begin() == metalog_path("./bin/y"));
}

UNIT_TEST(metalog_index, crlf_and_no_trailing_newline)
{
  metalog_index index;
  read_metalog(data("./a type=file size=1\r\n./b type=file size=2"),
               "METALOG", index);
  UNIT_TEST_CHECK(index.files.size() == 2);
  attr_value v;
  UNIT_TEST_CHECK(index.files[metalog_path("./a")][0]
                  .get_attr(attr_key("size"), v));
  UNIT_TEST_CHECK(v == attr_value("1"));
}

UNIT_TEST(metalog_index, empty_input)
{
  metalog_index index;
  read_metalog(data(""), "METALOG", index);
  UNIT_TEST_CHECK(index.files.empty());
  UNIT_TEST_CHECK(index.packages.empty());
}

UNIT_TEST(metalog_index, malformed_line_aborts)
{
  metalog_index index;
  try
    {
      read_metalog(data("./a type=file\n./lonely\n"), "METALOG", index);
      UNIT_TEST_CHECK(false);
    }
  catch (informative_failure & e)
    {
      UNIT_TEST_CHECK(string(e.what())
                      == "error: METALOG:2: malformed METALOG line './lonely'");
    }
  UNIT_TEST_CHECK(index.files.empty());
}

UNIT_TEST(metalog_index, any_whitespace_line_is_blank)
{
  metalog_index index;
  read_metalog(data("./a type=file mode=0644 size=1\n"
                    "\f\n"
                    "\v \t\n"
                    "\t# comment after a tab\n"
                    "./b type=file size=2\n"),
               "METALOG", index);
  UNIT_TEST_REQUIRE(index.files.size() == 2);
  UNIT_TEST_CHECK(index.files[metalog_path("./b")][0].lineno == 5);
}

UNIT_TEST(metalog_index, lone_carriage_return_is_not_a_line_break)
{
  metalog_index index;
  read_metalog(data("./a type=file mode=0644\r./a type=file mode=0644\n"
                    "./b type=file\n"),
               "METALOG", index);
  UNIT_TEST_REQUIRE(index.files.size() == 2);
  vector<metalog_row> const & a = index.files[metalog_path("./a")];
  UNIT_TEST_REQUIRE(a.size() == 1);
  UNIT_TEST_CHECK(a[0].lineno == 1);
  UNIT_TEST_CHECK(index.files[metalog_path("./b")][0].lineno == 2);
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
