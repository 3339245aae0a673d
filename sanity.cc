// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "base.hh"
#include <algorithm>
#include <iterator>
#include <iostream>
#include <fstream>
#include "vector.hh"
#include <sstream>

#include <boost/format.hpp>
#include <boost/circular_buffer.hpp>

#include "constants.hh"
#include "platform.hh"
#include "sanity.hh"
#include "simplestring_xform.hh"

using std::exception;
using std::locale;
using std::logic_error;
using std::ofstream;
using std::ostream;
using std::ostream_iterator;
using std::ostringstream;
using std::runtime_error;
using std::string;
using std::vector;

using boost::format;

// how much of the log reaches the user
enum verbosity
  {
    verbose_debug,
    verbose_normal,
    verbose_quiet,
    verbose_silent
  };

struct sanity::impl
{
  verbosity level;
  boost::circular_buffer<char> logbuf;
  string dump_path;
  string gasp_dump;
  bool gasping;
  vector<MusingI const *> musings;

  impl()
    : level(verbose_normal), logbuf(constants::log_buffer_sz), gasping(false)
  {}
};

// debugging / logging system

// the macros can fire from static constructors, before main() has had a
// chance to call initialize()
static void
require_initialized(void const * imp, char const * who)
{
  if (!imp)
    throw logic_error(string(who) + " called before sanity::initialize");
}

static string
quote_command_line(int argc, char ** argv)
{
  ostringstream ss;
  for (int i = 0; i < argc; ++i)
    ss << (i ? ", '" : "'") << argv[i] << '\'';
  return ss.str();
}

sanity::sanity() : imp(NULL)
{}

sanity::~sanity()
{
  delete imp;
}

// Permanent musings survive a logbuf overflow, so a crash report always
// shows where we ran and how we were called.  Subclasses add their own.
void
sanity::initialize(int argc, char ** argv, char const * lc_all)
{
  delete imp;
  imp = new impl;

  string system_flavour;
  get_system_flavour(system_flavour);
  PERM_MM(system_flavour);
  L(FL("started up on %s") % system_flavour);

  string cmdline_string = quote_command_line(argc, argv);
  PERM_MM(cmdline_string);
  L(FL("command line: %s") % cmdline_string);

  string locale_string(lc_all ? lc_all : "n/a");
  PERM_MM(locale_string);
  L(FL("set locale: LC_ALL=%s") % locale_string);
}

void
sanity::dump_buffer()
{
  I(imp);
  if (imp->dump_path.empty())
    {
      inform_message("discarding debug log, because I have nowhere to write it\n"
                     "(maybe you want --debug or --dump?)");
      return;
    }

  ofstream out(imp->dump_path.c_str());
  if (!out)
    {
      inform_message((FL("failed to write debugging log to %s")
                      % imp->dump_path).str());
      return;
    }
  copy(imp->logbuf.begin(), imp->logbuf.end(), ostream_iterator<char>(out));
  out << imp->gasp_dump;
  inform_message((FL("wrote debugging log to %s\n"
                     "if reporting a bug, please include this file")
                  % imp->dump_path).str());
}

void
sanity::set_debug()
{
  I(imp);
  imp->level = verbose_debug;

  // anything logged while the options were read has only reached the
  // ring buffer so far
  string backlog(imp->logbuf.begin(), imp->logbuf.end());
  vector<string> lines;
  split_into_lines(backlog, lines);
  for (vector<string>::const_iterator i = lines.begin(); i != lines.end(); ++i)
    inform_log(*i + "\n");
}

void
sanity::set_quiet()
{
  I(imp);
  imp->level = verbose_quiet;
}

void
sanity::set_reallyquiet()
{
  I(imp);
  imp->level = verbose_silent;
}

// the first --dump wins
void
sanity::set_dump_path(string const & path)
{
  I(imp);
  if (!imp->dump_path.empty())
    return;
  L(FL("setting dump path to %s") % path);
  imp->dump_path = path;
}

string
sanity::do_format(format_base const & fmt, char const * file, int line)
{
  try
    {
      return fmt.str();
    }
  catch (exception const & e)
    {
      inform_error((F("fatal: formatter failed on %s:%d: %s")
                    % file % line % e.what()).str());
      throw;
    }
}

void
sanity::append_to_logbuf(string const & str)
{
  copy(str.begin(), str.end(), back_inserter(imp->logbuf));
  if (str.empty() || str[str.size() - 1] != '\n')
    imp->logbuf.push_back('\n');
}

// every message lands in the ring buffer, whether or not it is shown
string
sanity::record(format_base const & fmt, char const * file, int line,
               char const * prefix)
{
  string str = do_format(fmt, file, line);
  if (str.size() > constants::log_line_sz)
    {
      str.resize(constants::log_line_sz);
      str[str.size() - 1] = '\n';
    }
  append_to_logbuf(prefix + str);
  return str;
}

void
sanity::log(plain_format const & fmt, char const * file, int line)
{
  require_initialized(imp, "sanity::log");
  string str = record(fmt, file, line, "");
  if (imp->level == verbose_debug)
    inform_log(str);
}

void
sanity::progress(i18n_format const & fmt, char const * file, int line)
{
  require_initialized(imp, "sanity::progress");
  string str = record(fmt, file, line, "");
  if (imp->level < verbose_quiet)
    inform_message(str);
}

void
sanity::warning(i18n_format const & fmt, char const * file, int line)
{
  require_initialized(imp, "sanity::warning");
  string str = record(fmt, file, line, "warning: ");
  if (imp->level < verbose_silent)
    inform_warning(str);
}

void
sanity::naughty_failure(char const * expr, i18n_format const & explain,
                        char const * file, int line)
{
  require_initialized(imp, "sanity::naughty_failure");
  log(FL("%s:%d: usage constraint '%s' violated") % file % line % expr,
      file, line);
  string message;
  prefix_lines_with(_("misuse: "), do_format(explain, file, line), message);
  gasp();
  throw informative_failure(message);
}

void
sanity::error_failure(char const * expr, i18n_format const & explain,
                      char const * file, int line)
{
  require_initialized(imp, "sanity::error_failure");
  log(FL("%s:%d: detected error '%s' violated") % file % line % expr,
      file, line);
  string message;
  prefix_lines_with(_("error: "), do_format(explain, file, line), message);
  gasp();
  throw informative_failure(message);
}

void
sanity::invariant_failure(char const * expr, char const * file, int line)
{
  require_initialized(imp, "sanity::invariant_failure");
  char const * pattern = N_("%s:%d: invariant '%s' violated");
  log(FL(pattern) % file % line % expr, file, line);
  gasp();
  throw logic_error((F(pattern) % file % line % expr).str());
}

void
sanity::index_failure(char const * vec_expr, char const * idx_expr,
                      unsigned long sz, unsigned long idx,
                      char const * file, int line)
{
  require_initialized(imp, "sanity::index_failure");
  char const * pattern
    = N_("%s:%d: index '%s' = %d overflowed vector '%s' with size %d");
  log(FL(pattern) % file % line % idx_expr % idx % vec_expr % sz,
      file, line);
  gasp();
  throw logic_error((F(pattern)
                     % file % line % idx_expr % idx % vec_expr % sz).str());
}

// Last gasp dumps

void
sanity::push_musing(MusingI const * musing)
{
  I(imp);
  if (!imp->gasping)
    imp->musings.push_back(musing);
}

void
sanity::pop_musing(MusingI const * musing)
{
  I(imp);
  if (imp->gasping)
    return;
  I(imp->musings.back() == musing);
  imp->musings.pop_back();
}

// A musing whose dump() fails still contributes what it wrote so far.
static void
gasp_one(MusingI const * musing, ostream & out)
{
  string tmp;
  try
    {
      musing->gasp(tmp);
      out << tmp;
    }
  catch (logic_error const &)
    {
      out << tmp << "<caught logic_error>\n";
      L(FL("ignoring error trigged by saving work set to debug log"));
    }
  catch (informative_failure const &)
    {
      out << tmp << "<caught informative_failure>\n";
      L(FL("ignoring error trigged by saving work set to debug log"));
    }
}

void
sanity::gasp()
{
  if (!imp)
    return;
  if (imp->gasping)
    {
      L(FL("ignoring request to give last gasp; already in process of dumping"));
      return;
    }

  imp->gasping = true;
  L(FL("saving current work set: %d items") % imp->musings.size());
  ostringstream out;
  // the newline stays out of the translation
  out << (F("Current work set: %d items") % imp->musings.size()) << '\n';
  for (vector<MusingI const *>::const_iterator i = imp->musings.begin();
       i != imp->musings.end(); ++i)
    gasp_one(*i, out);
  imp->gasp_dump = out.str();
  L(FL("finished saving work set"));

  if (imp->level == verbose_debug)
    {
      inform_log("contents of work set:");
      inform_log(imp->gasp_dump);
    }
  imp->gasping = false;
}

template <> void
dump(string const & obj, string & out)
{
  out = obj;
}

void
open_musing(musing_site const & site, string & out)
{
  out = (format("----- begin '%s' (in %s, at %s:%d)\n")
         % site.name % site.func % site.file % site.line).str();
}

void
close_musing(musing_site const & site, string const & body, string & out)
{
  out += body;
  if (!body.empty() && body[body.size() - 1] != '\n')
    out += '\n';
  out += (format("-----   end '%s' (in %s, at %s:%d)\n")
          % site.name % site.func % site.file % site.line).str();
}

// locale("") throws when the environment names a locale the runtime does
// not have
static locale const &
get_user_locale()
{
  static locale user_locale(locale::classic());
  static bool looked = false;
  if (!looked)
    {
      looked = true;
      try
        {
          user_locale = locale("");
        }
      catch (runtime_error const &)
        {
          // stay with the classic locale
        }
    }
  return user_locale;
}

struct format_base::impl
{
  format fmt;
  ostringstream arg;

  impl(string const & pattern) : fmt(pattern) {}
  impl(string const & pattern, locale const & loc) : fmt(pattern, loc) {}
  // arguments already fed are part of fmt; a half-streamed one is not
  impl(impl const & other) : fmt(other.fmt) {}

private:
  impl & operator=(impl const &);
};

format_base::format_base(string const & pattern, bool localized)
  : pimpl(localized ? new impl(pattern, get_user_locale())
                    : new impl(pattern))
{}

format_base::format_base(format_base const & other)
  : pimpl(other.pimpl ? new impl(*other.pimpl) : NULL)
{}

format_base::~format_base()
{
  delete pimpl;
}

format_base &
format_base::operator=(format_base const & other)
{
  if (&other != this)
    {
      impl * copied = other.pimpl ? new impl(*other.pimpl) : NULL;
      delete pimpl;
      pimpl = copied;
    }
  return *this;
}

ostream &
format_base::arg_stream() const
{
  return pimpl->arg;
}

void
format_base::take_streamed_arg() const
{
  pimpl->fmt % pimpl->arg.str();
  pimpl->arg.str(string());
}

void
format_base::take_signed(s64 arg) const
{
  pimpl->fmt % arg;
}

void
format_base::take_unsigned(u64 arg) const
{
  pimpl->fmt % arg;
}

string
format_base::str() const
{
  return pimpl->fmt.str();
}

ostream &
operator<<(ostream & os, format_base const & fmt)
{
  return os << fmt.str();
}

i18n_format
F(char const * str)
{
  return i18n_format(gettext(str));
}

plain_format
FL(char const * str)
{
  return plain_format(str);
}

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"

UNIT_TEST(sanity, invariant_throws_logic_error)
{
  UNIT_TEST_CHECK_THROW(I(1 == 2), logic_error);
  I(1 == 1);
}

UNIT_TEST(sanity, errors_are_informative)
{
  try
    {
      E(false, F("cannot open '%s'") % "METALOG");
      UNIT_TEST_CHECK(false);
    }
  catch (informative_failure & e)
    {
      UNIT_TEST_CHECK(string(e.what()) == "error: cannot open 'METALOG'");
    }

  try
    {
      N(false, F("no input given"));
      UNIT_TEST_CHECK(false);
    }
  catch (informative_failure & e)
    {
      UNIT_TEST_CHECK(string(e.what()) == "misuse: no input given");
    }
}

UNIT_TEST(sanity, format_integers_and_strings)
{
  UNIT_TEST_CHECK((FL("%s has %d rows") % string("./bin/sh") % 3).str()
                  == "./bin/sh has 3 rows");
  u64 big = 4294967296ULL;
  UNIT_TEST_CHECK((FL("%d") % big).str() == "4294967296");
  UNIT_TEST_CHECK((FL("line %d") % static_cast<unsigned long>(12)).str()
                  == "line 12");
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
