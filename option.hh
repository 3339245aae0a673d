#ifndef __OPTION_HH__
#define __OPTION_HH__

#include <stdexcept>
#include <set>
#include "vector.hh"

#include <boost/function.hpp>
#include "lexical_cast.hh"

#include "sanity.hh"
#include "vocab.hh"

// one word of the command line
class arg_type : public utf8 {
public:
  explicit arg_type(void) : utf8() {}
  explicit arg_type(std::string const & s) : utf8(s) {}
};
template <>
inline void dump(arg_type const & a, std::string & out) { out = a(); }
typedef std::vector< arg_type > args_vector;

namespace option {
  // everything the parser throws; the driver turns it into exit status 2
  struct option_error : public std::invalid_argument
  {
    option_error(std::string const & str);
  };
  struct unknown_option : public option_error
  {
    unknown_option(std::string const & opt);
  };
  struct missing_arg : public option_error
  {
    missing_arg(std::string const & opt);
  };
  // "--flag=x" or "-fx" for a flag
  struct extra_arg : public option_error
  {
    extra_arg(std::string const & opt);
  };
  // the setter could not convert the argument
  struct bad_arg : public option_error
  {
    bad_arg(std::string const & opt, arg_type const & arg);
  };

  struct concrete_option
  {
    std::string description;
    std::string longname;
    std::string shortname;
    bool has_arg;
    boost::function<void (std::string)> setter;
    boost::function<void ()> resetter;

    concrete_option();
    // "names" is "long", "long,s" or "s"
    concrete_option(std::string const & names,
                    std::string const & desc,
                    bool arg,
                    boost::function<void (std::string)> set,
                    boost::function<void ()> reset);

    bool operator<(concrete_option const & other) const;
  };

  // Options are added with chained operator() calls.  The option named
  // "--" is handed every positional argument, and everything after a
  // bare "--" on the command line.
  struct concrete_option_set
  {
    std::set<concrete_option> options;
    concrete_option_set();

    // a flag
    concrete_option_set &
    operator()(std::string const & names,
               std::string const & desc,
               boost::function<void ()> set,
               boost::function<void ()> reset = 0);
    // an option with an argument
    concrete_option_set &
    operator()(std::string const & names,
               std::string const & desc,
               boost::function<void (std::string)> set,
               boost::function<void ()> reset = 0);

    void reset() const;
    std::string get_usage_str() const;
    void from_command_line(args_vector & args);
    // argv[0] is skipped
    void from_command_line(int argc, char const * const * argv);
  };

  template<typename T>
  struct assign_value
  {
    T & item;
    explicit assign_value(T & i) : item(i) {}
    void operator()(std::string s) { item = boost::lexical_cast<T>(s); }
  };

  template<typename T>
  struct append_value
  {
    std::vector<T> & items;
    explicit append_value(std::vector<T> & i) : items(i) {}
    void operator()(std::string s)
    {
      items.push_back(boost::lexical_cast<T>(s));
    }
  };

  struct raise_flag
  {
    bool & flag;
    explicit raise_flag(bool & f) : flag(f) {}
    void operator()() { flag = true; }
  };

  template<typename T>
  struct restore_value
  {
    T & item;
    T value;
    restore_value(T & i, T const & v) : item(i), value(v) {}
    void operator()() { item = value; }
  };

  // setter(x) picks the right functor for x's type
  template<typename T> inline
  boost::function<void(std::string)> setter(T & item)
  {
    return assign_value<T>(item);
  }
  template<typename T> inline
  boost::function<void(std::string)> setter(std::vector<T> & items)
  {
    return append_value<T>(items);
  }
  inline boost::function<void()> setter(bool & flag)
  {
    return raise_flag(flag);
  }

  template<typename T> inline
  boost::function<void()> resetter(T & item, T const & value = T())
  {
    return restore_value<T>(item, value);
  }
}


// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif
