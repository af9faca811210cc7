// file      : ddlgen/traversal/relational/foreign-key.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_TRAVERSAL_RELATIONAL_FOREIGN_KEY_HXX
#define DDLGEN_TRAVERSAL_RELATIONAL_FOREIGN_KEY_HXX

#include <ddlgen/semantics/relational/foreign-key.hxx>
#include <ddlgen/traversal/relational/key.hxx>

namespace traversal
{
  namespace relational
  {
    struct foreign_key: key_template<semantics::relational::foreign_key> {};
  }
}

#endif // DDLGEN_TRAVERSAL_RELATIONAL_FOREIGN_KEY_HXX
