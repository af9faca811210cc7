// file      : ddlgen/traversal/relational/table.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_TRAVERSAL_RELATIONAL_TABLE_HXX
#define DDLGEN_TRAVERSAL_RELATIONAL_TABLE_HXX

#include <ddlgen/semantics/relational/table.hxx>
#include <ddlgen/traversal/relational/elements.hxx>

namespace traversal
{
  namespace relational
  {
    struct table: scope_template<semantics::relational::table> {};
  }
}

#endif // DDLGEN_TRAVERSAL_RELATIONAL_TABLE_HXX
