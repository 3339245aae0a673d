#ifndef __METALOG_SANITY_HH__
#define __METALOG_SANITY_HH__

#include "sanity.hh"

// the sanity object of the metalog program: everything it has to say
// goes through the global user_interface.
struct metalog_sanity : public sanity
{
  metalog_sanity();
  ~metalog_sanity();
  void initialize(int, char **, char const *);

private:
  void inform_log(std::string const &msg);
  void inform_message(std::string const &msg);
  void inform_warning(std::string const &msg);
  void inform_error(std::string const &msg);
};

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif
