// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

// this file contains a couple utilities to deal with the user
// interface. the global user_interface object 'ui' owns clog, so no
// writing to it directly!


#include "base.hh"
#include "platform.hh"
#include "sanity.hh"
#include "ui.hh"
#include "simplestring_xform.hh"
#include "constants.hh"

#include <iostream>
#include <fstream>
#include <set>

#include "current_exception.hh"

using std::clog;
using std::cout;
using std::endl;
using std::ios_base;
using std::ofstream;
using std::string;
using std::vector;

struct user_interface ui;

struct user_interface::impl
{
  std::set<string> issued_warnings;
};

// ui is a global, but its constructor and destructor do nothing; the
// real work happens in initialize() and deinitialize(), which cpp_main
// calls through a ui_library guard.

user_interface::user_interface() : prog_name("?"), imp(0) {}

user_interface::~user_interface()
{}

void
user_interface::initialize()
{
  imp = new user_interface::impl;

  // a report that cannot be written is an error, not a silent truncation
  cout.exceptions(ios_base::badbit);
  clog.unsetf(ios_base::unitbuf);
}

void
user_interface::deinitialize()
{
  I(imp);
  delete imp;
  imp = 0;
}

// each distinct warning is shown once
void
user_interface::warn(string const & warning)
{
  I(imp);
  if (!imp->issued_warnings.insert(warning).second)
    return;
  string message;
  prefix_lines_with(_("warning: "), warning, message);
  inform(message);
}

void
user_interface::warn(format_base const & fmt)
{
  warn(fmt.str());
}

// keep in step with bug_report_message in unix/main.cc
void
user_interface::fatal(string const & fatal)
{
  inform(F("fatal: %s\n"
           "this is almost certainly a bug in metalog.\n"
           "please send this error message, the output of '%s --full-version',\n"
           "and a description of what you were doing to %s.")
         % fatal % prog_name % PACKAGE_BUGREPORT);
  global_sanity.dump_buffer();
}

void
user_interface::fatal(format_base const & fmt)
{
  fatal(fmt.str());
}

void
user_interface::fatal_exception(std::exception const & ex)
{
  fatal(describe_exception(ex));
}

void
user_interface::fatal_exception()
{
  fatal(describe_current_exception());
}

string
user_interface::output_prefix()
{
  return (prog_name.empty() ? string("?") : prog_name) + ": ";
}

// METALOG names are printed as found; control characters in them must
// not reach the terminal
static string
sanitize(string const & line)
{
  string tmp(line);
  for (string::iterator i = tmp.begin(); i != tmp.end(); ++i)
    {
      unsigned char c = static_cast<unsigned char>(*i);
      if (c != '\n' && (c < 0x20 || c == 0x7f))
        *i = ' ';
    }
  return tmp;
}

void
user_interface::redirect_log_to(string const & filename)
{
  static ofstream log_file;
  if (log_file.is_open())
    log_file.close();
  log_file.open(filename.c_str(), ofstream::out | ofstream::app);
  E(log_file.is_open(), F("failed to open log file '%s'") % filename);
  clog.rdbuf(log_file.rdbuf());
}

void
user_interface::inform(string const & line)
{
  string prefixed;
  prefix_lines_with(output_prefix(), line, prefixed);
  clog << sanitize(prefixed) << endl;
}

void
user_interface::inform(format_base const & fmt)
{
  inform(fmt.str());
}

unsigned int
guess_terminal_width()
{
  unsigned int w = terminal_width();
  return w ? w : constants::default_terminal_width;
}

// One paragraph, its words joined by single spaces and wrapped at the
// terminal width.  Continuation lines start at "col".
static string
format_paragraph(string const & text, size_t col, size_t curcol)
{
  I(text.find('\n') == string::npos);

  size_t const maxcol = guess_terminal_width();
  string out;
  if (curcol < col)
    {
      out.append(col - curcol, ' ');
      curcol = col;
    }

  vector<string> words;
  split_into_words(text, words);
  for (size_t i = 0; i < words.size(); ++i)
    {
      if (i > 0)
        {
          if (curcol + 1 + words[i].size() > maxcol)
            {
              out += '\n';
              out.append(col, ' ');
              curcol = col;
            }
          else
            {
              out += ' ';
              ++curcol;
            }
        }
      out += words[i];
      curcol += words[i].size();
    }
  return out;
}

// Fits "text" to the terminal.  Lines of the input are paragraphs and
// come out separated by an empty line; "text" should not end in '\n'.
// The first line starts at column "curcol" and is indented up to "col".
string
format_text(string const & text, size_t const col, size_t curcol)
{
  I(curcol <= col);

  vector<string> paragraphs;
  split_into_lines(text, paragraphs);
  string out;
  for (size_t i = 0; i < paragraphs.size(); ++i)
    {
      if (i > 0)
        out += "\n\n";
      out += format_paragraph(paragraphs[i], col, i == 0 ? curcol : 0);
    }
  return out;
}

string
format_text(i18n_format const & text, size_t const col, size_t curcol)
{
  return format_text(text.str(), col, curcol);
}

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"

UNIT_TEST(ui, format_text_indents_and_joins)
{
  UNIT_TEST_CHECK(format_text("one  two\tthree", 2) == "  one two three");
  UNIT_TEST_CHECK(format_text("first\nsecond", 0) == "first\n\nsecond");
  UNIT_TEST_CHECK(format_text("", 0) == "");
}

UNIT_TEST(ui, format_text_wraps_long_lines)
{
  string word(guess_terminal_width() - 4, 'x');
  string out = format_text(word + " tail", 2);
  UNIT_TEST_CHECK(out == "  " + word + "\n  tail");
}

UNIT_TEST(ui, describe_exception)
{
  string spoon = describe_exception(std::runtime_error("There is no spoon."));
  UNIT_TEST_CHECK(spoon.find("runtime_error: There is no spoon.")
                  != string::npos);
  string bad = describe_exception(std::bad_exception());
  UNIT_TEST_CHECK(bad.find("bad_exception") != string::npos);
  UNIT_TEST_CHECK(bad.find(": ") == string::npos);
}

UNIT_TEST(ui, output_prefix)
{
  string saved = ui.prog_name;
  ui.prog_name = "metalog";
  UNIT_TEST_CHECK(ui.output_prefix() == "metalog: ");
  ui.prog_name = "";
  UNIT_TEST_CHECK(ui.output_prefix() == "?: ");
  ui.prog_name = saved;
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
