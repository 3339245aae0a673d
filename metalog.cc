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
#include <new>
#include <locale.h>

#include "i18n.h"
#include "constants.hh"
#include "file_io.hh"
#include "inode_index.hh"
#include "metalog_index.hh"
#include "metalog_report.hh"
#include "options.hh"
#include "sanity.hh"
#include "ui.hh"
#include "version.hh"

using std::cout;
using std::cerr;
using std::string;
using std::ios_base;

// cpp_main reads the options, runs the reports and holds the outermost
// catch clauses.  main() in unix/main.cc calls it once its signal
// handlers are in place.  Whatever escapes as an exception is reported
// here; a bug also dumps the debug log.

// ui is set up and torn down inside cpp_main, under the signal handlers,
// rather than by global constructors
struct ui_library
{
  ui_library() { ui.initialize(); }
  ~ui_library() { ui.deinitialize(); }
};

// thrown to print the usage message; an empty "why" means the user asked
// for it
struct usage
{
  string why;
  explicit usage(string const & w) : why(w) {}
};

// safe to call more than once; only the first call does anything
void
localize_metalog()
{
  static bool done = false;
  if (done)
    return;
  setlocale(LC_ALL, "");
  bindtextdomain(PACKAGE, LOCALEDIR);
  textdomain(PACKAGE);
  done = true;
}

static string
program_basename(char const * argv0)
{
  string prog_name(argv0 ? argv0 : "");
  string::size_type slash = prog_name.rfind('/');
  if (slash != string::npos)
    prog_name.erase(0, slash + 1);
  if (prog_name.empty())
    prog_name = PACKAGE;
  return prog_name;
}

static void
apply_global_options(metalog_options const & opts)
{
  if (!opts.log.empty())
    ui.redirect_log_to(opts.log);
  if (!opts.dump.empty())
    global_sanity.set_dump_path(opts.dump);
  if (opts.debug)
    global_sanity.set_debug();
  else if (opts.reallyquiet)
    global_sanity.set_reallyquiet();
  else if (opts.quiet)
    global_sanity.set_quiet();
}

static void
audit_metalog(metalog_options const & opts)
{
  string const & source = opts.args[0];

  data dat;
  read_data_for_command_line(utf8(source), dat);

  metalog_index index;
  read_metalog(dat, source == constants::stdin_filename
               ? string(_("<stdin>")) : source, index);
  P(F("read %d entries for %d names in %d packages")
    % index.row_count() % index.files.size() % index.packages.size());

  string report;
  package_report(index, report);

  string warnings, errors;
  dup_report(index, warnings, errors);
  report += warnings;
  report += errors;

  if (opts.inodes)
    {
      filesystem_inode_lookup lookup(opts.root);
      inode_map inodes;
      build_inode_index(index, lookup, inodes);
      inode_report(index, inodes, report);
    }

  cout << report;
  cout.flush();
}

static void
print_usage(std::ostream & out, option::concrete_option_set const & optset,
            bool with_description)
{
  out << F("Usage: %s [OPTION...] METALOG") % ui.prog_name << "\n\n";
  if (with_description)
    out << format_text(F("Reports file counts, sizes and privileged files "
                         "per package, and names listed more than once with "
                         "conflicting metadata.  A METALOG of '-' is read "
                         "from standard input."))
        << "\n\n";
  out << optset.get_usage_str();
}

// Returns after printing the version or the reports; throws usage for
// everything print_usage should handle.
static int
run_command_line(metalog_options & opts,
                 option::concrete_option_set & optset,
                 int argc, char ** argv)
{
  optset.from_command_line(argc, argv);
  apply_global_options(opts);

  if (opts.full_version)
    {
      print_full_version();
      return 0;
    }
  if (opts.version)
    {
      print_version();
      return 0;
    }
  if (opts.help)
    throw usage("");

  if (opts.args.empty())
    throw usage(_("no METALOG given"));
  if (opts.args.size() > 1)
    throw usage(_("only one METALOG may be given"));

  audit_metalog(opts);
  return 0;
}

int
cpp_main(int argc, char ** argv)
{
  localize_metalog();

  // before anything that might issue a diagnostic
  ui_library acquire_ui;

  try
    {
      global_sanity.initialize(argc, argv, setlocale(LC_ALL, 0));
      ui.prog_name = program_basename(argc > 0 ? argv[0] : 0);

      metalog_options opts;
      option::concrete_option_set optset = metalog_option_set(opts);
      try
        {
          return run_command_line(opts, optset, argc, argv);
        }
      catch (option::option_error const & e)
        {
          ui.inform(e.what());
          print_usage(cerr, optset, false);
          return 2;
        }
      catch (usage const & u)
        {
          // asked-for help goes to stdout so that it can be paged; a
          // usage error must not disappear down a pipe
          if (u.why.empty())
            {
              print_usage(cout, optset, true);
              return 0;
            }
          ui.inform(F("misuse: %s") % u.why);
          print_usage(cerr, optset, true);
          return 2;
        }
    }
  catch (informative_failure const & inf)
    {
      ui.inform(inf.what());
      return 1;
    }
  catch (ios_base::failure const &)
    {
      ui.inform(_("error: failed to write the report"));
      return 1;
    }
  catch (std::bad_alloc const &)
    {
      ui.inform(_("error: memory exhausted"));
      return 1;
    }
  catch (std::exception const & ex)
    {
      ui.fatal_exception(ex);
      return 3;
    }
  catch (...)
    {
      ui.fatal_exception();
      return 3;
    }
}

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
