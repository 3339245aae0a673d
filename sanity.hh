#ifndef __SANITY_HH__
#define __SANITY_HH__

// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include <stdexcept>
#include <ostream>

#include "boost/current_function.hpp"
#include "boost/throw_exception.hpp"

#include "i18n.h"
#include "numeric_vocab.hh"

// assertions, logging and error reporting for the whole program.  all
// formatting goes through a typesafe boost::format wrapper declared below.

// this is for error messages where we want a clean and inoffensive error
// message to make it to the user, not a diagnostic error indicating
// internal failure but a suggestion that they do something differently.

class informative_failure : public std::exception {
  std::string const whatmsg;
public:
  explicit informative_failure(std::string const & s) : whatmsg(s) {};
  virtual ~informative_failure() throw() {};
  virtual char const * what() const throw() { return whatmsg.c_str(); }
};

class MusingI;

class format_base;
struct plain_format;
struct i18n_format;

struct sanity {
  sanity();
  virtual ~sanity();
  virtual void initialize(int, char **, char const *);
  void dump_buffer();
  void set_debug();
  void set_quiet();
  void set_reallyquiet();
  void set_dump_path(std::string const & path);

  void log(plain_format const & fmt,
           char const * file, int line);
  void progress(i18n_format const & fmt,
                char const * file, int line);
  void warning(i18n_format const & fmt,
               char const * file, int line);
  NORETURN(void naughty_failure(char const * expr, i18n_format const & explain,
                       char const * file, int line));
  NORETURN(void error_failure(char const * expr, i18n_format const & explain,
                     char const * file, int line));
  NORETURN(void invariant_failure(char const * expr,
                         char const * file, int line));
  NORETURN(void index_failure(char const * vec_expr,
                     char const * idx_expr,
                     unsigned long sz,
                     unsigned long idx,
                     char const * file, int line));
  void gasp();
  void push_musing(MusingI const *musing);
  void pop_musing(MusingI const *musing);

private:
  std::string do_format(format_base const & fmt,
                        char const * file, int line);
  std::string record(format_base const & fmt, char const * file, int line,
                     char const * prefix);
  void append_to_logbuf(std::string const & str);
  virtual void inform_log(std::string const &msg) = 0;
  virtual void inform_message(std::string const &msg) = 0;
  virtual void inform_warning(std::string const &msg) = 0;
  virtual void inform_error(std::string const &msg) = 0;

  struct impl;
  impl * imp;
};

extern sanity & global_sanity;

// boost::format is kept out of the headers.  A format object is the
// pattern plus the arguments fed to it so far.  Integers reach
// boost::format as integers, so that "%d" and friends keep their meaning;
// anything else is rendered with operator<< first.

class format_base
{
protected:
  struct impl;
  impl * pimpl;

  format_base() : pimpl(NULL) {}
  format_base(std::string const & pattern, bool localized);
  ~format_base();
  format_base(format_base const & other);
  format_base & operator=(format_base const & other);

public:
  // const so that "F(...) % x" works on the temporary F returns.
  std::ostream & arg_stream() const;
  void take_streamed_arg() const;
  void take_signed(s64 arg) const;
  void take_unsigned(u64 arg) const;

  std::string str() const;
};

// developer text, never translated
struct plain_format : public format_base
{
  plain_format() {}
  explicit plain_format(std::string const & pattern)
    : format_base(pattern, false) {}
};

// text shown to the user, formatted in the user's locale
struct i18n_format : public format_base
{
  i18n_format() {}
  explicit i18n_format(std::string const & localized_pattern)
    : format_base(localized_pattern, true) {}
};

#define FORMAT_INTEGER_ARG(format_ty, arg_ty, how)               \
inline format_ty const &                                         \
operator %(format_ty const & f, arg_ty a)                        \
{                                                                \
  f.take_ ## how(a);                                             \
  return f;                                                      \
}

#define FORMAT_OPERATORS(format_ty)                              \
template <typename T> inline format_ty const &                   \
operator %(format_ty const & f, T const & t)                     \
{                                                                \
  f.arg_stream() << t;                                           \
  f.take_streamed_arg();                                         \
  return f;                                                      \
}                                                                \
FORMAT_INTEGER_ARG(format_ty, int, signed)                       \
FORMAT_INTEGER_ARG(format_ty, long, signed)                      \
FORMAT_INTEGER_ARG(format_ty, long long, signed)                 \
FORMAT_INTEGER_ARG(format_ty, unsigned int, unsigned)            \
FORMAT_INTEGER_ARG(format_ty, unsigned long, unsigned)           \
FORMAT_INTEGER_ARG(format_ty, unsigned long long, unsigned)

FORMAT_OPERATORS(plain_format)
FORMAT_OPERATORS(i18n_format)

#undef FORMAT_OPERATORS
#undef FORMAT_INTEGER_ARG

std::ostream & operator<<(std::ostream & os, format_base const & fmt);

// F is for when you want to build a boost formatter for display
i18n_format F(const char * str);

// FL is for when you want to build a boost formatter for the developers -- it
// is not gettextified.  Think of the L as "literal" or "log".
plain_format FL(const char * str);

// L is for logging, you can log all you want
#define L(fmt) global_sanity.log(fmt, __FILE__, __LINE__)

// P is for progress, log only stuff which the user might
// normally like to see some indication of progress of
#define P(fmt) global_sanity.progress(fmt, __FILE__, __LINE__)

// W is for warnings, which are handled like progress only
// they are only issued once and are prefixed with "warning: "
#define W(fmt) global_sanity.warning(fmt, __FILE__, __LINE__)


// invariants and assertions

#ifdef __GNUC__
#define LIKELY(zz) (__builtin_expect((zz), 1))
#define UNLIKELY(zz) (__builtin_expect((zz), 0))
#else
#define LIKELY(zz) (zz)
#define UNLIKELY(zz) (zz)
#endif

// I is for invariants that "should" always be true
// (if they are wrong, there is a *bug*)
#define I(e) \
do { \
  if(UNLIKELY(!(e))) { \
    global_sanity.invariant_failure("I("#e")", __FILE__, __LINE__); \
  } \
} while(0)

// N is for naughtyness on behalf of the user
// (if they are wrong, the user just did something wrong)
#define N(e, explain)\
do { \
  if(UNLIKELY(!(e))) { \
    global_sanity.naughty_failure("N("#e")", (explain), __FILE__, __LINE__); \
  } \
} while(0)

// E is for errors; they are normal (i.e., not a bug), but not necessarily
// attributable to user naughtiness
#define E(e, explain)\
do { \
  if(UNLIKELY(!(e))) { \
    global_sanity.error_failure("E("#e")", (explain), __FILE__, __LINE__); \
  } \
} while(0)

// Last gasp dumps.  Every live MM() registers itself with global_sanity;
// when something goes wrong the registered objects are dump()ed into the
// debug log.

class MusingI
{
public:
  MusingI() { global_sanity.push_musing(this); }
  virtual ~MusingI() { global_sanity.pop_musing(this); }
  virtual void gasp(std::string & out) const = 0;
};

// where an MM() was written
struct musing_site
{
  char const * name;
  char const * file;
  char const * func;
  int line;
};

// "out" receives the opening line before the object is dumped, so that a
// dump() which throws still leaves a trace.
void open_musing(musing_site const & site, std::string & out);
void close_musing(musing_site const & site, std::string const & body,
                  std::string & out);

template <typename T> struct unref { typedef T type; };
template <typename T> struct unref<T &> { typedef T type; };

template <typename T>
class Musing : public MusingI
{
public:
  Musing(typename unref<T>::type const & obj, char const * name,
         char const * file, int line, char const * func)
    : obj(obj)
  {
    site.name = name;
    site.file = file;
    site.func = func;
    site.line = line;
  }

  virtual void gasp(std::string & out) const
  {
    std::string body;
    open_musing(site, out);
    dump(obj, body);
    close_musing(site, body, out);
  }

private:
  typename unref<T>::type const & obj;
  musing_site site;
};

// __LINE__ has to be expanded before it is pasted into the variable name
#ifdef HAVE_TYPEOF
#define MM_AT(obj, line) \
  Musing<__typeof__(obj)> musing_on_line_ ## line \
    (obj, #obj, __FILE__, __LINE__, BOOST_CURRENT_FUNCTION)
#define MM_LINE(obj, line) MM_AT(obj, line)
#define MM(obj) MM_LINE(obj, __LINE__)

// a musing that is never popped; the object is copied to the heap
#define PERM_MM(obj) \
  new Musing<__typeof__(obj)>(*(new unref<__typeof__(obj)>::type(obj)), \
                              #obj, __FILE__, __LINE__, BOOST_CURRENT_FUNCTION)

#else
#define MM(obj) /* */
#define PERM_MM(obj) /* */
#endif

template <> void dump(std::string const & obj, std::string & out);

//////////////////////////////////////////////////////////////////////////
// Local Variables:
// mode: C++
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
//////////////////////////////////////////////////////////////////////////

#endif // __SANITY_HH__
