#ifndef __METALOG_REPORT_HH__
#define __METALOG_REPORT_HH__

// Copyright (C) 2008 The metalog developers
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

// The three reports are pure queries over a finished index.  Each one
// appends complete lines to its output string(s); nothing is written to
// the terminal from here.

#include "metalog_index.hh"
#include "inode_index.hh"

// "--- PACKAGE REPORTS ---" followed by one block per package:
//
//   Package NAME:[ setuid][ setgid]
//     number of files: N
//     total size: S
//
// N and S are "?" when a file of the package has conflicting entries.
void
package_report(metalog_index const & index, std::string & out);

// one line per name listed more than once.  Agreeing entries go to
// "warnings", conflicting ones to "errors".
void
dup_report(metalog_index const & index,
           std::string & warnings, std::string & errors);

// one line per group of hard links whose entries disagree
void
inode_report(metalog_index const & index, inode_map const & inodes,
             std::string & out);

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif // __METALOG_REPORT_HH__
