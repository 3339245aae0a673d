// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

// this fragment is included into both vocab.hh and vocab.cc,
// in order to minimize code duplication.

ATOMIC_NOVERIFY(utf8);        // unknown string in UTF8 charset
ATOMIC_NOVERIFY(data);        // meaningless blob, e.g. a whole METALOG

ATOMIC(metalog_path);         // entry name exactly as the METALOG spells it
ATOMIC(attr_key);             // left of the first '=' in an attribute
ATOMIC(attr_value);           // right of the first '=' in an attribute
ATOMIC(package_name);         // one element of a "package=" tag list


// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
