#ifndef __METALOG_INDEX_HH__
#define __METALOG_INDEX_HH__

// Copyright (C) 2008 The metalog developers
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include <map>
#include <set>

#include "metalog_row.hh"

typedef std::map<metalog_path, std::vector<metalog_row> > file_map;
typedef std::map<package_name, std::set<metalog_path> > package_map;

// Both maps are filled by one pass over the METALOG and only read after
// that.  Every row sits in exactly one "files" bucket, in file order.
struct metalog_index
{
  file_map files;
  package_map packages;

  size_t row_count() const;
};

// "source" names the input in diagnostics.  A malformed line is an E()
// failure naming source and line number; no partial index is usable then.
void
read_metalog(data const & dat, std::string const & source,
             metalog_index & index);

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif // __METALOG_INDEX_HH__
