// file      : ddlgen/traversal/class.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_TRAVERSAL_CLASS_HXX
#define DDLGEN_TRAVERSAL_CLASS_HXX

#include <ddlgen/semantics/class.hxx>
#include <ddlgen/traversal/elements.hxx>

namespace traversal
{
  struct class_: scope_template<semantics::class_> {};
}

#endif // DDLGEN_TRAVERSAL_CLASS_HXX
