// Copyright (C) 2004 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "base.hh"
#include "simplestring_xform.hh"
#include "char_classifiers.hh"
#include "sanity.hh"

#include <sstream>

using std::string;
using std::vector;
using std::ostringstream;

void
split_into_lines(string const & in,
                 vector<string> & out)
{
  out.clear();

  // lines end at 0x0a only; a lone 0x0d is part of the line.  One 0x0d
  // right before the 0x0a is dropped, so "\r\n" files read the same.
  string::size_type begin = 0;
  while (begin < in.size())
    {
      string::size_type end = in.find('\n', begin);
      if (end == string::npos)
        end = in.size();
      string::size_type len = end - begin;
      if (len > 0 && in[end - 1] == '\r')
        --len;
      out.push_back(in.substr(begin, len));
      begin = end + 1;
    }
}

void
split_into_words(string const & in,
                 vector<string> & out)
{
  out.clear();
  string::const_iterator i = in.begin();
  while (i != in.end())
    {
      while (i != in.end() && is_space(*i))
        ++i;
      string::const_iterator word = i;
      while (i != in.end() && !is_space(*i))
        ++i;
      if (word != i)
        out.push_back(string(word, i));
    }
}

void
prefix_lines_with(string const & prefix, string const & lines, string & out)
{
  vector<string> msgs;
  split_into_lines(lines, msgs);

  ostringstream oss;
  for (vector<string>::const_iterator i = msgs.begin();
       i != msgs.end();)
    {
      oss << prefix << *i;
      i++;
      if (i != msgs.end())
        oss << '\n';
    }

  out = oss.str();
}


#ifdef BUILD_UNIT_TESTS
#include <set>
#include "unit_tests.hh"
#include "vocab.hh"

using std::set;

UNIT_TEST(simplestring_xform, split_into_lines)
{
  vector<string> lines;

  split_into_lines("", lines);
  UNIT_TEST_CHECK(lines.empty());

  split_into_lines("./a type=file\n\n# comment\r\n./b type=dir", lines);
  UNIT_TEST_REQUIRE(lines.size() == 4);
  UNIT_TEST_CHECK(lines[0] == "./a type=file");
  UNIT_TEST_CHECK(lines[1] == "");
  UNIT_TEST_CHECK(lines[2] == "# comment");
  UNIT_TEST_CHECK(lines[3] == "./b type=dir");

  split_into_lines("one\r\ntwo\r\n", lines);
  UNIT_TEST_REQUIRE(lines.size() == 2);
  UNIT_TEST_CHECK(lines[1] == "two");

  // a lone carriage return does not end a line
  split_into_lines("./a mode=0644\r./a mode=0644\n./b\r\r\n", lines);
  UNIT_TEST_REQUIRE(lines.size() == 2);
  UNIT_TEST_CHECK(lines[0] == "./a mode=0644\r./a mode=0644");
  UNIT_TEST_CHECK(lines[1] == "./b\r");

  split_into_lines("\n\n", lines);
  UNIT_TEST_REQUIRE(lines.size() == 2);
  UNIT_TEST_CHECK(lines[0].empty() && lines[1].empty());
}

UNIT_TEST(simplestring_xform, split_into_words)
{
  vector<string> words;

  split_into_words("", words);
  UNIT_TEST_CHECK(words.empty());

  split_into_words("   \t ", words);
  UNIT_TEST_CHECK(words.empty());

  split_into_words("uname=root  gname=wheel\tmode=0644 ", words);
  UNIT_TEST_REQUIRE(words.size() == 3);
  UNIT_TEST_CHECK(words[0] == "uname=root");
  UNIT_TEST_CHECK(words[1] == "gname=wheel");
  UNIT_TEST_CHECK(words[2] == "mode=0644");
}

UNIT_TEST(simplestring_xform, join_words)
{
  vector< utf8 > v;
  set< utf8 > s;

  UNIT_TEST_CHECK(join_words(v)() == "");

  v.push_back(utf8("./bin/ls"));
  UNIT_TEST_CHECK(join_words(v, ",")() == "./bin/ls");

  v.push_back(utf8("./bin/sh"));
  UNIT_TEST_CHECK(join_words(v)() == "./bin/ls ./bin/sh");
  UNIT_TEST_CHECK(join_words(v, ",")() == "./bin/ls,./bin/sh");

  s.insert(utf8("b"));
  s.insert(utf8("a"));
  UNIT_TEST_CHECK(join_words(s, ", ")() == "a, b");
}

UNIT_TEST(simplestring_xform, prefix_lines_with)
{
  string out;
  prefix_lines_with("error: ", "cannot open\nno such file", out);
  UNIT_TEST_CHECK(out == "error: cannot open\nerror: no such file");
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
