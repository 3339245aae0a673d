#ifndef __METALOG_ROW_HH__
#define __METALOG_ROW_HH__

// Copyright (C) 2008 The metalog developers
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

// A METALOG line is "NAME key=value key=value ...", as written by
// 'mtree -c | mtree -C' during a package build.  Names keep whatever
// escaping mtree gave them ("\040" for a space); we never decode it.

#include <set>
#include <utility>

#include "vector.hh"
#include "vocab.hh"
#include "numeric_vocab.hh"

typedef std::pair<attr_key, attr_value> metalog_attr;

// attributes stay in the order their keys first appeared on the line, so
// the "first differing key" of a comparison is the same on every run.
struct metalog_row
{
  metalog_path filename;
  size_t lineno;
  std::vector<metalog_attr> attrs;

  metalog_row() : lineno(0) {}

  bool has_attr(attr_key const & key) const;
  bool get_attr(attr_key const & key, attr_value & val) const;

  // a repeated key replaces the earlier value in the earlier position
  void set_attr(attr_key const & key, attr_value const & val);
};

template <> void
dump(metalog_row const & row, std::string & out);

// Splits one non-blank, non-comment line.  Returns false, leaving "row"
// untouched, if the line has no "NAME <whitespace> attributes" shape.
// Tokens without '=' or with an empty key or value are dropped.
bool
parse_metalog_row(std::string const & line, size_t lineno,
                  metalog_row & row);

// Compares every row against rows[0].  Only the keys a row carries are
// looked up in rows[0]; a key rows[0] lacks, or a key the row lacks, is
// never a conflict.  When ignore_name is false a differing filename is a
// conflict too, reported with an empty "offby".
bool
rows_all_equal(std::vector<metalog_row> const & rows, bool ignore_name,
               attr_key & offby);

// The packages named by the first "package=" in the row's tags.
void
get_row_packages(metalog_row const & row, std::set<package_name> & pkgs);

// "mode" as octal.  false if missing or not an octal number.
bool
get_row_mode(metalog_row const & row, u32 & mode);

// "size" as decimal.  false if missing or not a decimal number.
bool
get_row_size(metalog_row const & row, u64 & size);

// "type" equals t
bool
row_has_type(metalog_row const & row, char const * t);

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif // __METALOG_ROW_HH__
