// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

// this file contains magic constants which you could, in theory, tweak.
// probably best not to tweak them though.
//
// style notes: (1) scalar constants should be defined in constants.hh so
// their values are visible to the compiler; (2) do not use std::string or
// any other non-POD type for aggregate constants defined in this file;
// (3) use "char const foo[]" instead of "char const * const foo".

#include "base.hh"
#include "constants.hh"

namespace constants
{
  char const mode_attribute[] = "mode";
  char const size_attribute[] = "size";
  char const type_attribute[] = "type";
  char const tags_attribute[] = "tags";

  char const file_type[] = "file";
  char const dir_type[] = "dir";
  char const link_type[] = "link";

  char const package_tag_prefix[] = "package=";

  char const stdin_filename[] = "-";
}

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
