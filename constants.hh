#ifndef __CONSTANTS_HH__
#define __CONSTANTS_HH__

// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include <cstddef>
#include "numeric_vocab.hh"

namespace constants
{
  // this file contains magic constants which you could, in theory, tweak.
  // probably best not to tweak them though.
  // all scalar constants are defined in this file so their values are
  // visible to the compiler; aggregate constants are defined in
  // constants.cc.

  // size of a line of text in the log buffer, beyond which log lines will be
  // truncated.
  std::size_t const log_line_sz = 0x300;

  // number of bytes of log kept in memory for the crash dump
  std::size_t const log_buffer_sz = 0xffff;

  // assumed width of the terminal, when we can't query for it directly
  std::size_t const default_terminal_width = 72;

  // permission bits in a METALOG "mode" attribute that mark a package as
  // carrying privileged files
  u32 const setuid_bit = 04000;
  u32 const setgid_bit = 02000;

  // attribute keys the reports look at
  extern char const mode_attribute[];
  extern char const size_attribute[];
  extern char const type_attribute[];
  extern char const tags_attribute[];

  // values of the "type" attribute
  extern char const file_type[];
  extern char const dir_type[];
  extern char const link_type[];

  // the tag that introduces the package list inside "tags"
  extern char const package_tag_prefix[];

  // the filename that means "read standard input"
  extern char const stdin_filename[];
}

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif // __CONSTANTS_HH__
