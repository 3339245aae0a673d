#ifndef __OPTIONS_HH__
#define __OPTIONS_HH__

#include "option.hh"

// everything the command line can say, gathered before any work starts
struct metalog_options
{
  metalog_options();

  bool help;
  bool version;
  bool full_version;
  bool inodes;
  bool debug;
  bool quiet;
  bool reallyquiet;
  std::string root;
  std::string dump;
  std::string log;
  std::vector<std::string> args;
};

option::concrete_option_set
metalog_option_set(metalog_options & opts);

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif
