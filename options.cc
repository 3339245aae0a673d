#include "base.hh"
#include "options.hh"

using std::string;
using std::vector;

metalog_options::metalog_options()
  : help(false), version(false), full_version(false), inodes(false),
    debug(false), quiet(false), reallyquiet(false)
{}

option::concrete_option_set
metalog_option_set(metalog_options & opts)
{
  using option::setter;
  using option::resetter;

  option::concrete_option_set os;
  os("--", "", setter(opts.args), resetter(opts.args))
    ("help,h", _("display help message"),
     setter(opts.help), resetter(opts.help, false))
    ("version", _("print version number, then exit"),
     setter(opts.version), resetter(opts.version, false))
    ("full-version", _("print detailed version number, then exit"),
     setter(opts.full_version), resetter(opts.full_version, false))
    ("inodes", _("also check that hard links agree on their metadata"),
     setter(opts.inodes), resetter(opts.inodes, false))
    ("root", _("directory the METALOG names are relative to (default /)"),
     setter(opts.root), resetter(opts.root))
    ("debug", _("print debug log to stderr while running"),
     setter(opts.debug), resetter(opts.debug, false))
    ("quiet", _("suppress informational and progress messages"),
     setter(opts.quiet), resetter(opts.quiet, false))
    ("reallyquiet", _("suppress warning, informational and progress messages"),
     setter(opts.reallyquiet), resetter(opts.reallyquiet, false))
    ("dump", _("file to dump debugging log to, on failure"),
     setter(opts.dump), resetter(opts.dump))
    ("log", _("file to write the log to"),
     setter(opts.log), resetter(opts.log));
  return os;
}

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"

UNIT_TEST(options, defaults)
{
  metalog_options opts;
  char const * cmdline[] = {"metalog", "METALOG"};
  metalog_option_set(opts).from_command_line(2, cmdline);
  UNIT_TEST_CHECK(!opts.help);
  UNIT_TEST_CHECK(!opts.inodes);
  UNIT_TEST_CHECK(opts.root.empty());
  UNIT_TEST_REQUIRE(opts.args.size() == 1);
  UNIT_TEST_CHECK(opts.args[0] == "METALOG");
}

UNIT_TEST(options, all_set)
{
  metalog_options opts;
  char const * cmdline[] = {"metalog", "--inodes", "--root=/mnt",
                            "--dump", "/tmp/dump", "-h", "--quiet", "-"};
  option::concrete_option_set os = metalog_option_set(opts);
  os.from_command_line(8, cmdline);
  UNIT_TEST_CHECK(opts.inodes);
  UNIT_TEST_CHECK(opts.help);
  UNIT_TEST_CHECK(opts.quiet);
  UNIT_TEST_CHECK(!opts.reallyquiet);
  UNIT_TEST_CHECK(opts.root == "/mnt");
  UNIT_TEST_CHECK(opts.dump == "/tmp/dump");
  UNIT_TEST_REQUIRE(opts.args.size() == 1);
  UNIT_TEST_CHECK(opts.args[0] == "-");

  os.reset();
  UNIT_TEST_CHECK(!opts.inodes);
  UNIT_TEST_CHECK(opts.root.empty());
  UNIT_TEST_CHECK(opts.args.empty());
}

UNIT_TEST(options, unknown_option)
{
  metalog_options opts;
  char const * cmdline[] = {"metalog", "--frobnicate", "METALOG"};
  UNIT_TEST_CHECK_THROW(metalog_option_set(opts).from_command_line(3, cmdline),
                        option::unknown_option);
  char const * cmdline2[] = {"metalog", "--root"};
  UNIT_TEST_CHECK_THROW(metalog_option_set(opts).from_command_line(2, cmdline2),
                        option::missing_arg);
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
