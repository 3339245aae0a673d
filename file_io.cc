// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "base.hh"
#include <iostream>
#include <fstream>
#include <sstream>
#include <cerrno>

#include "constants.hh"
#include "file_io.hh"
#include "sanity.hh"
#include "platform.hh"

// this file deals with talking to the filesystem and loading files.

using std::cin;
using std::ifstream;
using std::ios_base;
using std::istream;
using std::ostringstream;
using std::string;

void
require_path_is_file(string const & path,
                     i18n_format const & message_if_nonexistent,
                     i18n_format const & message_if_directory)
{
  switch (get_path_status(path))
    {
    case path::nonexistent:
      E(false, message_if_nonexistent);
      break;
    case path::file:
      return;
    case path::directory:
      E(false, message_if_directory);
      break;
    }
}

static void
slurp(istream & in, string const & name, data & dat)
{
  ostringstream oss;
  // an empty stream sets failbit on oss, which is fine
  oss << in.rdbuf();
  E(!in.bad(), F("error reading %s") % name);
  dat = data(oss.str());
  L(FL("read %d bytes from %s") % dat().size() % name);
}

void
read_data(string const & p, data & dat)
{
  require_path_is_file(p,
                       F("cannot open file %s for reading: %s")
                       % p % os_strerror(ENOENT),
                       F("file %s cannot be read as data; it is a directory") % p);

  ifstream file(p.c_str(), ios_base::in | ios_base::binary);
  if (!file)
    {
      const int err = errno;
      E(false, F("cannot open file %s for reading: %s") % p % os_strerror(err));
    }
  slurp(file, p, dat);
}

void
read_data_stdin(data & dat)
{
  static bool have_consumed_stdin = false;
  N(!have_consumed_stdin, F("Cannot read standard input multiple times"));
  have_consumed_stdin = true;
  slurp(cin, _("standard input"), dat);
}

void
read_data_for_command_line(utf8 const & path, data & dat)
{
  if (path() == constants::stdin_filename)
    read_data_stdin(dat);
  else
    read_data(path(), dat);
}

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"

UNIT_TEST(file_io, missing_file)
{
  data dat;
  UNIT_TEST_CHECK_THROW(read_data("/nonexistent/metalog/METALOG", dat),
                        informative_failure);
  UNIT_TEST_CHECK_THROW(read_data_for_command_line
                        (utf8("/nonexistent/metalog/METALOG"), dat),
                        informative_failure);

  try
    {
      read_data("/nonexistent/metalog/METALOG", dat);
      UNIT_TEST_CHECK(false);
    }
  catch (informative_failure & e)
    {
      UNIT_TEST_CHECK(string(e.what())
                      == "error: cannot open file /nonexistent/metalog/METALOG"
                         " for reading: " + os_strerror(ENOENT));
    }
}

UNIT_TEST(file_io, directory)
{
  data dat;
  UNIT_TEST_CHECK_THROW(read_data("/", dat), informative_failure);
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
