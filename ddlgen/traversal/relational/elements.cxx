// file      : ddlgen/traversal/relational/elements.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <ddlgen/traversal/relational/elements.hxx>

namespace traversal
{
  namespace relational
  {
    void names::
    traverse (type& e)
    {
      dispatch (e.nameable ());
    }
  }
}
