// file      : ddlgen/traversal/relational/column.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_TRAVERSAL_RELATIONAL_COLUMN_HXX
#define DDLGEN_TRAVERSAL_RELATIONAL_COLUMN_HXX

#include <ddlgen/semantics/relational/column.hxx>
#include <ddlgen/traversal/relational/elements.hxx>

namespace traversal
{
  namespace relational
  {
    struct column: node<semantics::relational::column> {};
  }
}

#endif // DDLGEN_TRAVERSAL_RELATIONAL_COLUMN_HXX
