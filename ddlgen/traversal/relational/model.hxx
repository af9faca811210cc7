// file      : ddlgen/traversal/relational/model.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_TRAVERSAL_RELATIONAL_MODEL_HXX
#define DDLGEN_TRAVERSAL_RELATIONAL_MODEL_HXX

#include <ddlgen/semantics/relational/model.hxx>
#include <ddlgen/traversal/relational/elements.hxx>

namespace traversal
{
  namespace relational
  {
    struct model: scope_template<semantics::relational::model> {};
  }
}

#endif // DDLGEN_TRAVERSAL_RELATIONAL_MODEL_HXX
