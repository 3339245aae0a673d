#ifndef __FILE_IO_H__
#define __FILE_IO_H__

// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "vocab.hh"
#include "sanity.hh"

// this layer deals with talking to the filesystem and loading files.
// nothing here ever writes.

// use E()
void require_path_is_file(std::string const & path,
                          i18n_format const & message_if_nonexistent,
                          i18n_format const & message_if_directory);

void read_data(std::string const & path, data & dat);

// This function can only be called once per run.
void read_data_stdin(data & dat);

// "-" means stdin; anything else is a path
void read_data_for_command_line(utf8 const & path, data & dat);

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif // __FILE_IO_H__
