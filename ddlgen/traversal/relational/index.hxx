// file      : ddlgen/traversal/relational/index.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_TRAVERSAL_RELATIONAL_INDEX_HXX
#define DDLGEN_TRAVERSAL_RELATIONAL_INDEX_HXX

#include <ddlgen/semantics/relational/index.hxx>
#include <ddlgen/traversal/relational/key.hxx>

namespace traversal
{
  namespace relational
  {
    struct index: key_template<semantics::relational::index> {};
  }
}

#endif // DDLGEN_TRAVERSAL_RELATIONAL_INDEX_HXX
