#ifndef __SIMPLESTRING_XFORM_HH__
#define __SIMPLESTRING_XFORM_HH__

// Copyright (C) 2004 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "vector.hh"

// lines end in "\n", "\r\n" or a lone "\r"; empty lines are kept, so the
// index into "out" plus one is the physical line number.
void split_into_lines(std::string const & in,
                      std::vector<std::string> & out);

// words are separated by runs of whitespace; no empty words are produced.
void split_into_words(std::string const & in,
                      std::vector<std::string> & out);

template< class Container >
typename Container::value_type join_words(Container const & in, std::string const & sep = " ")
{
  std::string str;
  typename Container::const_iterator iter = in.begin();
  while (iter != in.end())
    {
      str += (*iter)();
      iter++;
      if (iter != in.end())
        str += sep;
    }
  typedef typename Container::value_type result_type;
  return result_type(str);
}

void prefix_lines_with(std::string const & prefix,
                       std::string const & lines,
                       std::string & out);

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif
