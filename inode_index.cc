// Copyright (C) 2008 The metalog developers
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "base.hh"

#include "inode_index.hh"
#include "platform.hh"
#include "sanity.hh"

using std::string;
using std::vector;

filesystem_inode_lookup::filesystem_inode_lookup(string const & r)
  : root(r)
{
  // "/" and "" both mean the filesystem root
  while (!root.empty() && root[root.size() - 1] == '/')
    root.erase(root.size() - 1);
}

string
resolve_metalog_path(string const & root, metalog_path const & name)
{
  string const & n = name();
  if (n == ".")
    return root.empty() ? string("/") : root;
  if (n.compare(0, 2, "./") == 0)
    return root + n.substr(1);
  if (n[0] == '/')
    return root + n;
  return root + "/" + n;
}

bool
filesystem_inode_lookup::lookup(metalog_path const & name, file_id & id)
{
  string path = resolve_metalog_path(root, name);
  string why;
  if (!get_inode_number(path, id, why))
    {
      L(FL("no inode for '%s' (%s): %s") % name % path % why);
      return false;
    }
  return true;
}

void
build_inode_index(metalog_index const & index, inode_lookup & lookup,
                  inode_map & inodes)
{
  inode_map tmp;
  size_t missing = 0;
  for (file_map::const_iterator i = index.files.begin();
       i != index.files.end(); ++i)
    {
      file_id id;
      if (lookup.lookup(i->first, id))
        tmp[id].push_back(i->first);
      else
        ++missing;
    }
  L(FL("%d names resolved to %d inodes, %d not found")
    % (index.files.size() - missing) % tmp.size() % missing);
  inodes.swap(tmp);
}

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"

namespace
{
  struct table_lookup : public inode_lookup
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
}

UNIT_TEST(inode_index, resolve_paths)
{
  UNIT_TEST_CHECK(resolve_metalog_path("", metalog_path("./etc/rc"))
                  == "/etc/rc");
  UNIT_TEST_CHECK(resolve_metalog_path("/mnt", metalog_path("./etc/rc"))
                  == "/mnt/etc/rc");
  UNIT_TEST_CHECK(resolve_metalog_path("", metalog_path(".")) == "/");
  UNIT_TEST_CHECK(resolve_metalog_path("/mnt", metalog_path(".")) == "/mnt");
  UNIT_TEST_CHECK(resolve_metalog_path("/mnt", metalog_path("/etc/rc"))
                  == "/mnt/etc/rc");
  UNIT_TEST_CHECK(resolve_metalog_path("/mnt", metalog_path("etc/rc"))
                  == "/mnt/etc/rc");
}

UNIT_TEST(inode_index, root_is_normalized)
{
  filesystem_inode_lookup slash("/");
  filesystem_inode_lookup empty("");
  file_id a, b;
  UNIT_TEST_CHECK(slash.lookup(metalog_path("."), a));
  UNIT_TEST_CHECK(empty.lookup(metalog_path("./"), b));
  UNIT_TEST_CHECK(a == b);
  UNIT_TEST_CHECK(!empty.lookup(metalog_path("./nonexistent/metalog"), a));
}

UNIT_TEST(inode_index, groups_in_index_order)
{
  metalog_index index;
  read_metalog(data("./usr/bin/vi type=file\n"
                    "./usr/bin/ex type=file\n"
                    "./usr/bin/view type=file\n"
                    "./gone type=file\n"
                    "./etc type=dir\n"),
               "METALOG", index);

  table_lookup lookup;
  lookup.table["./usr/bin/vi"] = file_id(1, 77);
  lookup.table["./usr/bin/ex"] = file_id(1, 77);
  lookup.table["./usr/bin/view"] = file_id(1, 77);
  lookup.table["./etc"] = file_id(1, 5);

  inode_map inodes;
  build_inode_index(index, lookup, inodes);
  UNIT_TEST_REQUIRE(inodes.size() == 2);
  UNIT_TEST_CHECK(inodes.begin()->first == file_id(1, 5));
  vector<metalog_path> const & vi = inodes[file_id(1, 77)];
  UNIT_TEST_REQUIRE(vi.size() == 3);
  UNIT_TEST_CHECK(vi[0] == metalog_path("./usr/bin/ex"));
  UNIT_TEST_CHECK(vi[1] == metalog_path("./usr/bin/vi"));
  UNIT_TEST_CHECK(vi[2] == metalog_path("./usr/bin/view"));
}

UNIT_TEST(inode_index, same_inode_on_other_device_is_another_file)
{
  metalog_index index;
  read_metalog(data("./proc type=dir\n"
                    "./sys type=dir\n"
                    "./bin/ls type=file\n"
                    "./bin/dir type=file\n"),
               "METALOG", index);

  table_lookup lookup;
  lookup.table["./proc"] = file_id(22, 1);
  lookup.table["./sys"] = file_id(23, 1);
  lookup.table["./bin/ls"] = file_id(8, 1);
  lookup.table["./bin/dir"] = file_id(8, 1);

  inode_map inodes;
  build_inode_index(index, lookup, inodes);
  UNIT_TEST_REQUIRE(inodes.size() == 3);
  UNIT_TEST_CHECK(inodes[file_id(22, 1)].size() == 1);
  UNIT_TEST_CHECK(inodes[file_id(23, 1)].size() == 1);
  UNIT_TEST_CHECK(inodes[file_id(8, 1)].size() == 2);
  UNIT_TEST_CHECK(inodes.begin()->first == file_id(8, 1));
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
