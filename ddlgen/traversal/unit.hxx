// file      : ddlgen/traversal/unit.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_TRAVERSAL_UNIT_HXX
#define DDLGEN_TRAVERSAL_UNIT_HXX

#include <ddlgen/semantics/unit.hxx>
#include <ddlgen/traversal/elements.hxx>

namespace traversal
{
  struct unit: scope_template<semantics::unit> {};
}

#endif // DDLGEN_TRAVERSAL_UNIT_HXX
