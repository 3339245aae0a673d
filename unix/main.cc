// Copyright (C) 2006  Zack Weinberg  <zackw@panix.com>
// Based on code by Graydon Hoare and contributors
// Originally derived from execution_monitor.cpp, a part of boost.
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.


// The outermost main().  The program logic starts in cpp_main(), in
// metalog.cc; all this file does is make sure that a crash or an
// interrupt still ends with a message on stderr.
//
// Only async-signal-safe calls may be made from the handlers below:
// write, raise and strsignal (which in practice does not allocate).  No
// stdio, no iostreams, no memory allocation.


#include "base.hh"
#include <signal.h>
#include <string.h>
#include <unistd.h>

static char const * argv0;

// short writes are retried; a failing write leaves nothing else to try
static void
write_str_to_stderr(char const * s)
{
  size_t len = strlen(s);
  while (len > 0)
    {
      ssize_t n = write(2, s, len);
      if (n <= 0)
        return;
      s += n;
      len -= n;
    }
}

// this message should be kept consistent with ui.cc::fatal (it is not
// exactly the same)
static void
bug_report_message()
{
  write_str_to_stderr("\nthis is almost certainly a bug in metalog."
                      "\nplease send this error message, the output of '");
  write_str_to_stderr(argv0);
  write_str_to_stderr(" --full-version',"
                      "\nand a description of what you were doing to "
                      PACKAGE_BUGREPORT "\n");
}

// signals which would normally trigger a core dump get a slightly more
// helpful error message first.
static void
bug_signal(int signo)
{
  write_str_to_stderr(argv0);
  write_str_to_stderr(": fatal signal: ");
  write_str_to_stderr(strsignal(signo));
  bug_report_message();
  write_str_to_stderr("do not send a core dump, but if you have one, "
                      "\nplease preserve it in case we ask you for "
                      "information from it.\n");

  // SA_RESETHAND has put the default handler back; the signal is blocked
  // until we return, and is delivered then.
  raise(signo);
}

// a user interrupt is not a bug.  metalog never writes to disk, so there
// is nothing to clean up before dying.
static void
interrupt_signal(int signo)
{
  write_str_to_stderr(argv0);
  write_str_to_stderr(": operation canceled: ");
  write_str_to_stderr(strsignal(signo));
  write_str_to_stderr("\n");
  raise(signo);
}

static const int bug_signals[] = {
  SIGQUIT, SIGILL, SIGABRT, SIGFPE, SIGSEGV, SIGBUS, SIGSYS, SIGTRAP
};
// SIGPIPE is left alone: "metalog METALOG | head" should just stop.
static const int interrupt_signals[] = {
  SIGHUP, SIGINT, SIGTERM
};

// each handler runs with all signals of its own group blocked
static void
install_handler(void (*handler)(int), int const * signals, size_t count)
{
  struct sigaction action;
  action.sa_flags = SA_RESETHAND;
  action.sa_handler = handler;
  sigemptyset(&action.sa_mask);
  for (size_t i = 0; i < count; i++)
    sigaddset(&action.sa_mask, signals[i]);
  for (size_t i = 0; i < count; i++)
    sigaction(signals[i], &action, 0);
}

extern int
cpp_main(int argc, char ** argv);

int
main(int argc, char ** argv)
{
  argv0 = argv[0];

  install_handler(&bug_signal, bug_signals,
                  sizeof bug_signals / sizeof bug_signals[0]);
  install_handler(&interrupt_signal, interrupt_signals,
                  sizeof interrupt_signals / sizeof interrupt_signals[0]);

  return cpp_main(argc, argv);
}

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
