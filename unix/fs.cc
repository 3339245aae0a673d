// copyright (C) 2005 nathaniel smith <njs@pobox.com>
// all rights reserved.
// licensed to the public under the terms of the GNU GPL (>= 2)
// see the file COPYING for details


#ifndef _FILE_OFFSET_BITS
#define _FILE_OFFSET_BITS 64
#endif

#include "base.hh"
#include <errno.h>
#include <sys/types.h>
#include <sys/stat.h>

#include "sanity.hh"
#include "platform.hh"

using std::string;

path::status
get_path_status(string const & path)
{
  struct stat buf;
  int res;
  res = stat(path.c_str(), &buf);
  if (res < 0)
    {
      const int err = errno;
      if (err == ENOENT)
        return path::nonexistent;
      else
        E(false, F("error accessing file %s: %s") % path % os_strerror(err));
    }
  if (S_ISDIR(buf.st_mode))
    return path::directory;
  // regular files, but also fifos and character devices, can be read
  // from start to end, which is all we ever do with them.
  return path::file;
}

bool
get_inode_number(string const & path, file_id & id, string & why)
{
  struct stat buf;
  if (stat(path.c_str(), &buf) < 0)
    {
      const int err = errno;
      why = os_strerror(err);
      return false;
    }
  id = file_id(static_cast<u64>(buf.st_dev), static_cast<u64>(buf.st_ino));
  return true;
}

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"

UNIT_TEST(fs, path_status)
{
  UNIT_TEST_CHECK(get_path_status("/") == path::directory);
  UNIT_TEST_CHECK(get_path_status("/nonexistent/metalog") == path::nonexistent);
}

UNIT_TEST(fs, inode_number)
{
  file_id a, b;
  string why;
  UNIT_TEST_CHECK(get_inode_number("/", a, why));
  UNIT_TEST_CHECK(get_inode_number("/.", b, why));
  UNIT_TEST_CHECK(a == b);

  UNIT_TEST_CHECK(!get_inode_number("/nonexistent/metalog", a, why));
  UNIT_TEST_CHECK(!why.empty());
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
