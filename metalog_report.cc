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

#include "constants.hh"
#include "metalog_report.hh"
#include "sanity.hh"
#include "simplestring_xform.hh"

using std::ostringstream;
using std::set;
using std::string;
using std::vector;

static string
join_line_numbers(vector<metalog_row> const & rows)
{
  ostringstream oss;
  for (vector<metalog_row>::const_iterator i = rows.begin();
       i != rows.end(); ++i)
    {
      if (i != rows.begin())
        oss << ',';
      oss << i->lineno;
    }
  return oss.str();
}

// Adds one file's contribution to its package.  Returns false once the
// numbers can no longer be known.
static bool
count_file(vector<metalog_row> const & rows, u64 & count, u64 & size)
{
  attr_key offby;
  if (rows.size() > 1 && !rows_all_equal(rows, false, offby))
    return false;

  metalog_row const & first = idx(rows, 0);
  ++count;
  if (row_has_type(first, constants::file_type))
    {
      u64 sz;
      if (!get_row_size(first, sz))
        {
          L(FL("'%s' line %d is a file without a usable size")
            % first.filename % first.lineno);
          return false;
        }
      size += sz;
    }
  return true;
}

static void
scan_modes(vector<metalog_row> const & rows, bool & setuid, bool & setgid)
{
  for (vector<metalog_row>::const_iterator r = rows.begin();
       r != rows.end(); ++r)
    {
      u32 mode;
      if (!get_row_mode(*r, mode))
        {
          L(FL("'%s' line %d has no usable mode") % r->filename % r->lineno);
          continue;
        }
      if (mode & constants::setuid_bit)
        setuid = true;
      if (mode & constants::setgid_bit)
        setgid = true;
    }
}

void
package_report(metalog_index const & index, string & out)
{
  ostringstream oss;
  oss << "--- PACKAGE REPORTS ---\n";

  for (package_map::const_iterator p = index.packages.begin();
       p != index.packages.end(); ++p)
    {
      u64 count = 0, size = 0;
      bool known = true, setuid = false, setgid = false;

      for (set<metalog_path>::const_iterator f = p->second.begin();
           f != p->second.end(); ++f)
        {
          file_map::const_iterator rows = index.files.find(*f);
          I(rows != index.files.end());
          if (known && !count_file(rows->second, count, size))
            known = false;
          scan_modes(rows->second, setuid, setgid);
        }

      oss << "Package " << p->first << ':';
      if (setuid)
        oss << " setuid";
      if (setgid)
        oss << " setgid";
      oss << '\n';
      if (known)
        oss << "  number of files: " << count << '\n'
            << "  total size: " << size << '\n';
      else
        oss << "  number of files: ?\n"
            << "  total size: ?\n";
    }

  L(FL("reported on %d packages") % index.packages.size());
  out += oss.str();
}

void
dup_report(metalog_index const & index, string & warnings, string & errors)
{
  ostringstream warn, err;
  for (file_map::const_iterator f = index.files.begin();
       f != index.files.end(); ++f)
    {
      vector<metalog_row> const & rows = f->second;
      if (rows.size() < 2)
        continue;

      attr_key offby;
      if (rows_all_equal(rows, false, offby))
        warn << "warning: " << f->first
             << " exists in multiple locations: line "
             << join_line_numbers(rows) << '\n';
      else
        err << "error: " << f->first
            << " exists in multiple locations and with different meta: line "
            << join_line_numbers(rows) << ". off by \"" << offby << "\"\n";
    }
  warnings += warn.str();
  errors += err.str();
}

void
inode_report(metalog_index const & index, inode_map const & inodes,
             string & out)
{
  ostringstream oss;
  for (inode_map::const_iterator g = inodes.begin(); g != inodes.end(); ++g)
    {
      vector<metalog_path> const & names = g->second;
      if (names.size() < 2)
        continue;

      // links and directories legitimately differ from what they point at
      vector<metalog_row> rows;
      for (vector<metalog_path>::const_iterator n = names.begin();
           n != names.end(); ++n)
        {
          file_map::const_iterator i = index.files.find(*n);
          I(i != index.files.end());
          metalog_row const & first = idx(i->second, 0);
          if (row_has_type(first, constants::link_type)
              || row_has_type(first, constants::dir_type))
            continue;
          rows.push_back(first);
        }
      if (rows.size() < 2)
        continue;

      attr_key offby;
      if (!rows_all_equal(rows, true, offby))
        oss << "error: entries point to the same inode but have different meta: "
            << join_words(names, ",") << " in line "
            << join_line_numbers(rows) << ". off by \"" << offby << "\"\n";
    }
  out += oss.str();
}

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"

namespace
{
  struct fixed_inodes : public inode_lookup
  {
    std::map<string, file_id> table;
    virtual bool lookup(metalog_path const & name, file_id & id)
    {
      std::map<string, file_id>::const_iterator i = table.find(name());
      if (i == table.end())
        return false;
      id = i->second;
      return true;
    }
  };

  void
  index_of(string const & text, metalog_index & index)
  {
    read_metalog(data(text), "METALOG", index);
  }
}

UNIT_TEST(metalog_report, identical_duplicates_warn)
{
  metalog_index index;
  index_of("./etc/foo type=file uname=root mode=0644 size=10\n"
           "./etc/foo type=file uname=root mode=0644 size=10\n", index);

  string pkgs, warnings, errors;
  package_report(index, pkgs);
  dup_report(index, warnings, errors);
  UNIT_TEST_CHECK(pkgs == "--- PACKAGE REPORTS ---\n");
  UNIT_TEST_CHECK(warnings
                  == "warning: ./etc/foo exists in multiple locations: line 1,2\n");
  UNIT_TEST_CHECK(errors.empty());
}

UNIT_TEST(metalog_report, no_duplicates_no_report)
{
  metalog_index index;
  index_of("./a type=file size=1\n./b type=file size=2\n", index);
  string warnings, errors;
  dup_report(index, warnings, errors);
  UNIT_TEST_CHECK(warnings.empty());
  UNIT_TEST_CHECK(errors.empty());
}

UNIT_TEST(metalog_report, conflicting_duplicates_error)
{
  metalog_index index;
  index_of("./etc/bar type=file mode=0644 size=3\n"
           "./etc/foo type=file mode=0644\n"
           "# comment\n"
           "./etc/foo type=file mode=0640\n"
           "./etc/bar type=file size=3\n", index);

  string warnings, errors;
  dup_report(index, warnings, errors);
  UNIT_TEST_CHECK(warnings
                  == "warning: ./etc/bar exists in multiple locations: line 1,5\n");
  UNIT_TEST_CHECK(errors
                  == "error: ./etc/foo exists in multiple locations and with"
                     " different meta: line 2,4. off by \"mode\"\n");
}

UNIT_TEST(metalog_report, package_counts_and_sizes)
{
  metalog_index index;
  index_of("./bin type=dir mode=0755 tags=package=core\n"
           "./bin/x type=file mode=0755 size=100 tags=package=core\n"
           "./bin/y type=file mode=0755 size=50 tags=package=core\n"
           "./bin/z type=link link=x tags=package=core\n", index);

  string out;
  package_report(index, out);
  UNIT_TEST_CHECK(out == "--- PACKAGE REPORTS ---\n"
                         "Package core:\n"
                         "  number of files: 4\n"
                         "  total size: 150\n");
}

UNIT_TEST(metalog_report, privileged_files)
{
  metalog_index index;
  index_of("./bin/su type=file mode=4755 size=1 tags=package=runtime\n"
           "./bin/wall type=file mode=2555 size=1 tags=package=utilities\n"
           "./bin/ls type=file mode=0755 size=1 tags=package=utilities\n"
           "./bin/sh type=file mode=0755 size=1 tags=package=shells\n"
           "./bin/ps type=file size=1 tags=package=shells\n", index);

  string out;
  package_report(index, out);
  UNIT_TEST_CHECK(out == "--- PACKAGE REPORTS ---\n"
                         "Package runtime: setuid\n"
                         "  number of files: 1\n"
                         "  total size: 1\n"
                         "Package shells:\n"
                         "  number of files: 2\n"
                         "  total size: 2\n"
                         "Package utilities: setgid\n"
                         "  number of files: 2\n"
                         "  total size: 2\n");
}

UNIT_TEST(metalog_report, unknown_numbers)
{
  metalog_index index;
  index_of("./a type=file mode=0644 size=1 tags=package=p\n"
           "./b type=file mode=0644 size=2 tags=package=p\n"
           "./b type=file mode=0640 size=2 tags=package=p\n"
           "./c type=file mode=0644 tags=package=q\n"
           "./d type=file mode=0644 size=12k tags=package=r\n", index);

  string out;
  package_report(index, out);
  UNIT_TEST_CHECK(out == "--- PACKAGE REPORTS ---\n"
                         "Package p:\n"
                         "  number of files: ?\n"
                         "  total size: ?\n"
                         "Package q:\n"
                         "  number of files: ?\n"
                         "  total size: ?\n"
                         "Package r:\n"
                         "  number of files: ?\n"
                         "  total size: ?\n");
}

UNIT_TEST(metalog_report, setuid_seen_on_any_duplicate)
{
  metalog_index index;
  index_of("./bin/x type=file mode=0755 size=1 tags=package=p\n"
           "./bin/x type=file mode=4755 size=1 tags=package=p\n", index);

  string out;
  package_report(index, out);
  UNIT_TEST_CHECK(out == "--- PACKAGE REPORTS ---\n"
                         "Package p: setuid\n"
                         "  number of files: ?\n"
                         "  total size: ?\n");
}

UNIT_TEST(metalog_report, output_is_repeatable)
{
  metalog_index index;
  index_of("./a type=file mode=0644 size=1 tags=package=p\n"
           "./a type=file mode=0600 size=1 tags=package=p\n", index);

  string first, second, w1, w2, e1, e2;
  package_report(index, first);
  package_report(index, second);
  dup_report(index, w1, e1);
  dup_report(index, w2, e2);
  UNIT_TEST_CHECK(first == second);
  UNIT_TEST_CHECK(w1 == w2);
  UNIT_TEST_CHECK(e1 == e2);
}

UNIT_TEST(metalog_report, hard_links_disagree)
{
  metalog_index index;
  index_of("./usr/bin/vi type=file uname=root mode=0555 size=9\n"
           "./usr/bin/ex type=file uname=root mode=0755 size=9\n"
           "./usr/bin/ex type=file uname=root mode=0555 size=9\n"
           "./usr/bin/view type=link link=vi\n"
           "./usr/bin/cat type=file mode=0555 size=2\n"
           "./usr/bin/tac type=file mode=0555 size=2\n", index);

  fixed_inodes lookup;
  lookup.table["./usr/bin/vi"] = file_id(3, 40);
  lookup.table["./usr/bin/ex"] = file_id(3, 40);
  lookup.table["./usr/bin/view"] = file_id(3, 40);
  lookup.table["./usr/bin/cat"] = file_id(3, 12);
  lookup.table["./usr/bin/tac"] = file_id(3, 12);

  inode_map inodes;
  build_inode_index(index, lookup, inodes);

  string out;
  inode_report(index, inodes, out);
  UNIT_TEST_CHECK(out
                  == "error: entries point to the same inode but have"
                     " different meta: ./usr/bin/ex,./usr/bin/vi,./usr/bin/view"
                     " in line 2,1. off by \"mode\"\n");
}

UNIT_TEST(metalog_report, hard_links_only_links_and_dirs)
{
  metalog_index index;
  index_of("./a type=file mode=0644\n"
           "./b type=link mode=0755\n"
           "./c type=dir mode=0700\n", index);

  fixed_inodes lookup;
  lookup.table["./a"] = file_id(3, 1);
  lookup.table["./b"] = file_id(3, 1);
  lookup.table["./c"] = file_id(3, 1);

  inode_map inodes;
  build_inode_index(index, lookup, inodes);

  string out;
  inode_report(index, inodes, out);
  UNIT_TEST_CHECK(out.empty());
}

UNIT_TEST(metalog_report, same_inode_number_on_two_devices)
{
  metalog_index index;
  index_of("./proc type=file mode=0555\n"
           "./sys type=file mode=0755\n", index);

  fixed_inodes lookup;
  lookup.table["./proc"] = file_id(22, 1);
  lookup.table["./sys"] = file_id(23, 1);

  inode_map inodes;
  build_inode_index(index, lookup, inodes);

  string out;
  inode_report(index, inodes, out);
  UNIT_TEST_CHECK(out.empty());
}

UNIT_TEST(metalog_report, duplicates_sorted_by_name)
{
  metalog_index index;
  index_of("./zeta mode=0644\n"
           "./alpha mode=0644\n"
           "./zeta mode=0644\n"
           "./mid mode=0600\n"
           "./alpha mode=0644\n"
           "./mid mode=0600\n"
           "./yy mode=0644\n"
           "./bb mode=0644\n"
           "./yy mode=0640\n"
           "./bb mode=0600\n"
           "./kk uname=root\n"
           "./kk uname=toor\n", index);

  string warnings, errors;
  dup_report(index, warnings, errors);
  UNIT_TEST_CHECK(warnings
                  == "warning: ./alpha exists in multiple locations: line 2,5\n"
                     "warning: ./mid exists in multiple locations: line 4,6\n"
                     "warning: ./zeta exists in multiple locations: line 1,3\n");
  UNIT_TEST_CHECK(errors
                  == "error: ./bb exists in multiple locations and with"
                     " different meta: line 8,10. off by \"mode\"\n"
                     "error: ./kk exists in multiple locations and with"
                     " different meta: line 11,12. off by \"uname\"\n"
                     "error: ./yy exists in multiple locations and with"
                     " different meta: line 7,9. off by \"mode\"\n");
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
