// file      : ddlgen/traversal.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_TRAVERSAL_HXX
#define DDLGEN_TRAVERSAL_HXX

#include <ddlgen/traversal/elements.hxx>
#include <ddlgen/traversal/class.hxx>
#include <ddlgen/traversal/unit.hxx>

#endif // DDLGEN_TRAVERSAL_HXX
