#include "base.hh"
#include <algorithm>
#include <map>

#include "option.hh"
#include "sanity.hh"
#include "ui.hh"

using std::map;
using std::set;
using std::string;
using std::vector;

namespace option {

option_error::option_error(string const & str)
 : std::invalid_argument((F("option error: %s") % str).str())
{}

unknown_option::unknown_option(string const & opt)
 : option_error((F("unknown option '%s'") % opt).str())
{}

missing_arg::missing_arg(string const & opt)
 : option_error((F("missing argument to option '%s'") % opt).str())
{}

extra_arg::extra_arg(string const & opt)
 : option_error((F("option '%s' does not take an argument") % opt).str())
{}

bad_arg::bad_arg(string const & opt, arg_type const & arg)
 : option_error((F("bad argument '%s' to option '%s'") % arg() % opt).str())
{}

concrete_option::concrete_option()
  : has_arg(false)
{}

concrete_option::concrete_option(string const & names,
                                 string const & desc,
                                 bool arg,
                                 boost::function<void (string)> set,
                                 boost::function<void ()> reset)
  : description(desc), has_arg(arg), setter(set), resetter(reset)
{
  string::size_type comma = names.find(',');
  longname = names.substr(0, comma);
  if (comma != string::npos)
    shortname = names.substr(comma + 1, 1);
  if (longname.size() == 1)
    {
      I(shortname.empty());
      longname.swap(shortname);
    }

  I(!description.empty() || !longname.empty() || !shortname.empty());
  // a named option can be set
  I(setter || (longname.empty() && shortname.empty()));
}

bool
concrete_option::operator<(concrete_option const & other) const
{
  if (longname != other.longname)
    return longname < other.longname;
  if (shortname != other.shortname)
    return shortname < other.shortname;
  return description < other.description;
}

concrete_option_set::concrete_option_set()
{}

// lets a flag share the one-argument setter slot
struct ignore_argument
{
  boost::function<void()> flag_setter;
  explicit ignore_argument(boost::function<void()> const & f)
    : flag_setter(f)
  {}
  void operator()(string const &) { flag_setter(); }
};

concrete_option_set &
concrete_option_set::operator()(string const & names,
                                string const & desc,
                                boost::function<void ()> set,
                                boost::function<void ()> reset)
{
  options.insert(concrete_option(names, desc, false,
                                 ignore_argument(set), reset));
  return *this;
}

concrete_option_set &
concrete_option_set::operator()(string const & names,
                                string const & desc,
                                boost::function<void (string)> set,
                                boost::function<void ()> reset)
{
  options.insert(concrete_option(names, desc, true, set, reset));
  return *this;
}

void
concrete_option_set::reset() const
{
  for (set<concrete_option>::const_iterator i = options.begin();
       i != options.end(); ++i)
    if (i->resetter)
      i->resetter();
}

void
concrete_option_set::from_command_line(int argc, char const * const * argv)
{
  args_vector words;
  for (int i = 1; i < argc; ++i)
    words.push_back(arg_type(argv[i]));
  from_command_line(words);
}

typedef map<string, concrete_option> option_index;

static option_index
index_options(set<concrete_option> const & options)
{
  option_index by_name;
  for (set<concrete_option>::const_iterator i = options.begin();
       i != options.end(); ++i)
    {
      if (!i->longname.empty())
        by_name.insert(make_pair(i->longname, *i));
      if (!i->shortname.empty())
        by_name.insert(make_pair(i->shortname, *i));
    }
  return by_name;
}

static concrete_option const &
find_option(option_index const & by_name, string const & name)
{
  option_index::const_iterator i = by_name.find(name);
  if (i == by_name.end())
    throw unknown_option(name);
  return i->second;
}

// Works out which option "word" names and, if it takes one, its argument:
// "--name=arg", "--name arg", "-sarg" and "-s arg" are all accepted.
// "next" is the word after "word", if any; the result says whether it was
// consumed as the argument.
static bool
decode_option(option_index const & by_name,
              string const & word, arg_type const * next,
              concrete_option & o, arg_type & arg)
{
  string name;
  bool inline_arg;
  string::size_type arg_start;

  if (word.substr(0, 2) == "--")
    {
      string::size_type equals = word.find('=');
      name = word.substr(2, equals == string::npos ? string::npos : equals - 2);
      inline_arg = (equals != string::npos);
      arg_start = equals + 1;
    }
  else
    {
      name = word.substr(1, 1);
      inline_arg = (word.size() > 2);
      arg_start = 2;
    }

  o = find_option(by_name, name);
  if (!o.has_arg)
    {
      if (inline_arg)
        throw extra_arg(name);
      return false;
    }
  if (inline_arg)
    {
      arg = arg_type(word.substr(arg_start));
      return false;
    }
  if (!next)
    throw missing_arg(name);
  arg = *next;
  return true;
}

void
concrete_option_set::from_command_line(args_vector & args)
{
  option_index by_name = index_options(options);

  bool only_positional = false;
  for (args_vector::size_type i = 0; i < args.size(); ++i)
    {
      string const & word = idx(args, i)();
      concrete_option o;
      arg_type arg;

      if (!only_positional && word == "--")
        {
          only_positional = true;
          continue;
        }

      // a lone "-" is a positional argument (standard input)
      if (only_positional || word.size() < 2 || word[0] != '-')
        {
          o = find_option(by_name, "--");
          arg = idx(args, i);
        }
      else
        {
          arg_type const * next = (i + 1 < args.size()) ? &idx(args, i + 1) : 0;
          if (decode_option(by_name, word, next, o, arg))
            ++i;
        }

      try
        {
          if (o.setter)
            o.setter(arg());
        }
      catch (boost::bad_lexical_cast const &)
        {
          throw bad_arg(o.longname.empty() ? o.shortname : o.longname, arg);
        }
    }
}

// "--long [ -s ] <arg>", or empty for the positional slot
static string
option_names(concrete_option const & opt)
{
  if (opt.longname == "--")
    return "";

  string out;
  if (!opt.longname.empty())
    out = "--" + opt.longname;
  if (!opt.shortname.empty())
    out += out.empty() ? "-" + opt.shortname : " [ -" + opt.shortname + " ]";
  if (!out.empty() && opt.has_arg)
    out += " <arg>";
  return out;
}

// Two columns: the names, indented by two spaces and padded to the
// longest, then two spaces and the description wrapped to the terminal.
string
concrete_option_set::get_usage_str() const
{
  size_t const indent = 2;
  size_t const gap = 2;

  size_t widest = 0;
  for (set<concrete_option>::const_iterator i = options.begin();
       i != options.end(); ++i)
    widest = std::max(widest, option_names(*i).size());

  size_t const desc_col = indent + widest + gap;
  string result;
  for (set<concrete_option>::const_iterator i = options.begin();
       i != options.end(); ++i)
    {
      string names = option_names(*i);
      if (names.empty())
        continue;

      result += string(indent, ' ') + names;
      if (!i->description.empty())
        result += string(widest - names.size() + gap, ' ')
                + format_text(i->description, desc_col, desc_col);
      result += '\n';
    }
  return result;
}

} // namespace option


#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"

UNIT_TEST(option, concrete_options)
{
  bool b = false;
  string s;
  u64 i = 1;
  vector<string> v;

  option::concrete_option_set os;
  os("--", "", option::setter(v), option::resetter(v))
    ("inodes,b", "", option::setter(b), option::resetter(b, false))
    ("s", "", option::setter(s))
    ("limit", "", option::setter(i));

  {
    char const * cmdline[] = {"progname", "pos", "-s", "str ing", "--limit", "10",
                              "--limit", "45", "--", "--bad", "foo", "-b"};
    os.from_command_line(12, cmdline);
  }
  UNIT_TEST_CHECK(!b);
  UNIT_TEST_CHECK(i == 45);
  UNIT_TEST_CHECK(s == "str ing");
  UNIT_TEST_CHECK(v.size() == 4);// pos --bad foo -b
  os.reset();
  UNIT_TEST_CHECK(v.empty());

  {
    args_vector cmdline;
    cmdline.push_back(arg_type("--inodes"));
    cmdline.push_back(arg_type("-s"));
    cmdline.push_back(arg_type("-s"));
    cmdline.push_back(arg_type("foo"));
    os.from_command_line(cmdline);
  }
  UNIT_TEST_CHECK(b);
  UNIT_TEST_CHECK(s == "-s");
  UNIT_TEST_CHECK(v.size() == 1);
  UNIT_TEST_CHECK(v[0] == "foo");
  os.reset();
  UNIT_TEST_CHECK(!b);

  {
    char const * cmdline[] = {"progname", "--bad_arg", "x"};
    UNIT_TEST_CHECK_THROW(os.from_command_line(3, cmdline), option::unknown_option);
  }

  {
    char const * cmdline[] = {"progname", "--inodes=x"};
    UNIT_TEST_CHECK_THROW(os.from_command_line(2, cmdline), option::extra_arg);
  }

  {
    char const * cmdline[] = {"progname", "-bx"};
    UNIT_TEST_CHECK_THROW(os.from_command_line(2, cmdline), option::extra_arg);
  }

  {
    char const * cmdline[] = {"progname", "-s"};
    UNIT_TEST_CHECK_THROW(os.from_command_line(2, cmdline), option::missing_arg);
  }

  {
    char const * cmdline[] = {"progname", "--limit=x"};
    UNIT_TEST_CHECK_THROW(os.from_command_line(2, cmdline), option::bad_arg);
  }

  {
    char const * cmdline[] = {"progname", "--limit=-1"};
    UNIT_TEST_CHECK_THROW(os.from_command_line(2, cmdline), option::bad_arg);
  }
}

UNIT_TEST(option, lone_dash_is_positional)
{
  vector<string> v;
  bool b = false;
  option::concrete_option_set os;
  os("--", "", option::setter(v))
    ("inodes", "", option::setter(b));

  char const * cmdline[] = {"progname", "--inodes", "-"};
  os.from_command_line(3, cmdline);
  UNIT_TEST_CHECK(b);
  UNIT_TEST_REQUIRE(v.size() == 1);
  UNIT_TEST_CHECK(v[0] == "-");
}

UNIT_TEST(option, usage_lists_named_options)
{
  bool b = false;
  string s;
  vector<string> v;
  option::concrete_option_set os;
  os("--", "", option::setter(v))
    ("help,h", "display help message", option::setter(b))
    ("root", "look names up below this directory", option::setter(s));

  string usage = os.get_usage_str();
  UNIT_TEST_CHECK(usage.find("--help [ -h ]") != string::npos);
  UNIT_TEST_CHECK(usage.find("--root <arg>") != string::npos);
  UNIT_TEST_CHECK(usage.find("display help message") != string::npos);
  UNIT_TEST_CHECK(usage.find("\n\n") == string::npos);
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

