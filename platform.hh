#ifndef __PLATFORM_HH__
#define __PLATFORM_HH__

// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

// this describes functions to be found in the unix/* directory.

#include <utility>

#include "numeric_vocab.hh"

void get_system_flavour(std::string & ident);

// return value of 0 means "unlimited"
unsigned int terminal_width();

// filesystem stuff
namespace path
{
  typedef enum { nonexistent, directory, file } status;
};
path::status get_path_status(std::string const & path);

// (device, inode); an inode number alone is only unique within one
// filesystem
typedef std::pair<u64, u64> file_id;

// fetches the device and inode number of "path", following symlinks.
// returns false and fills in "why" if the path cannot be examined.
bool get_inode_number(std::string const & path, file_id & id,
                      std::string & why);

// strerror wrapper for OS-specific errors
std::string os_strerror(os_err_t errnum);

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif // __PLATFORM_HH__
