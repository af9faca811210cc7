// file      : ddlgen/traversal/relational/primary-key.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_TRAVERSAL_RELATIONAL_PRIMARY_KEY_HXX
#define DDLGEN_TRAVERSAL_RELATIONAL_PRIMARY_KEY_HXX

#include <ddlgen/semantics/relational/primary-key.hxx>
#include <ddlgen/traversal/relational/key.hxx>

namespace traversal
{
  namespace relational
  {
    struct primary_key: key_template<semantics::relational::primary_key> {};
  }
}

#endif // DDLGEN_TRAVERSAL_RELATIONAL_PRIMARY_KEY_HXX
