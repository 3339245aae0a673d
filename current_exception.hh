// Copyright (C) 2007 Zack Weinberg <zackw@panix.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#ifndef CURRENT_EXCEPTION_HH
#define CURRENT_EXCEPTION_HH

// Names for exceptions that reach an outermost catch clause, for the
// "fatal:" message of the program and the log of the unit tester.

#include <cstdlib>
#include <cstring>
#include <exception>
#include <string>
#include <typeinfo>

#ifdef HAVE_CXXABI_H
#include <cxxabi.h>
#endif

// the demangled name of a type, or the raw name if the runtime cannot
// demangle it
inline std::string
demangled_type_name(std::type_info const & ty)
{
  char const * raw = ty.name();
#if defined(HAVE_CXXABI_H) && defined(HAVE___CXA_DEMANGLE)
  int status = -1;
  char * dem = abi::__cxa_demangle(raw, 0, 0, &status);
  if (status == 0 && dem)
    {
      std::string out(dem);
      std::free(dem);
      return out;
    }
#endif
  std::string out(raw);
  // some demanglers stick "class" at the beginning of their output,
  // which looks dumb in this context
  if (out.compare(0, 6, "class ") == 0)
    out.erase(0, 6);
  return out;
}

// "TYPE: WHAT", or just "TYPE" when what() says nothing more than the
// type name does
inline std::string
describe_exception(std::exception const & ex)
{
  std::string name = demangled_type_name(typeid(ex));
  char const * what = ex.what();
  if (what == 0 || what[0] == 0
      || !std::strcmp(what, typeid(ex).name())
      || name == what)
    return name;
  return name + ": " + what;
}

// for catch (...): the type of the exception in flight, if the runtime
// can tell
inline std::string
describe_current_exception()
{
#if defined(HAVE_CXXABI_H) && defined(HAVE___CXA_CURRENT_EXCEPTION_TYPE)
  std::type_info * ty = abi::__cxa_current_exception_type();
  if (ty)
    return demangled_type_name(*ty);
#endif
  return "exception of unknown type";
}

#endif

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
