#ifndef __INODE_INDEX_HH__
#define __INODE_INDEX_HH__

// Copyright (C) 2008 The metalog developers
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

// Names in a METALOG that share an inode on the installed system are hard
// links of each other.  Finding them needs the filesystem, so the lookup
// sits behind an interface that tests can replace.

#include <map>

#include "metalog_index.hh"
#include "platform.hh"

class inode_lookup
{
public:
  // false if the name cannot be resolved; such names are left out of the
  // inode groups
  virtual bool lookup(metalog_path const & name, file_id & id) = 0;
  virtual ~inode_lookup() {}
};

// Looks names up below "root", which stands in for the "." that METALOG
// names start with.  An empty root means the filesystem root.
class filesystem_inode_lookup : public inode_lookup
{
  std::string root;
public:
  explicit filesystem_inode_lookup(std::string const & root);
  virtual bool lookup(metalog_path const & name, file_id & id);
};

// "./usr/bin/env" under root "/mnt" is "/mnt/usr/bin/env"
std::string
resolve_metalog_path(std::string const & root, metalog_path const & name);

// names that share a device and an inode, in ascending (device, inode)
// order
typedef std::map<file_id, std::vector<metalog_path> > inode_map;

// groups keep the names in the order of index.files
void
build_inode_index(metalog_index const & index, inode_lookup & lookup,
                  inode_map & inodes);

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif // __INODE_INDEX_HH__
